#include "sync/tasks/Upload.hpp"
#include "sync/Progress.hpp"
#include "storage/Client.hpp"
#include "storage/errors.hpp"
#include "util/hash.hpp"
#include "log/Registry.hpp"

using namespace zs;
using namespace zs::sync::tasks;

Upload::Upload(Context& ctx, concurrency::AdmissionGate::Slot slot, model::UploadItem item)
    : Transfer(ctx, std::move(slot)), item(std::move(item)) {}

void Upload::transfer() {
    const auto& local = item.local;

    ctx.progress->addToTotalBytes(local.size_bytes);
    ctx.progress->startFile(local.key, local.size_bytes);

    if (ctx.dry_run) {
        log::Registry::sync()->info("[DRY RUN] Would upload {}", local.key);
    } else {
        log::Registry::sync()->debug("[UPLOAD] {} ({} bytes)", local.key, local.size_bytes);

        auto checksum = item.checksum;
        if (!checksum) {
            try {
                checksum = util::sha256File(local.absolute_path);
            } catch (const std::runtime_error& e) {
                throw storage::LocalIOError(local.key, e.what());
            }
        }

        ctx.client->upload(local.key, local.absolute_path, checksum,
                           [this](const uintmax_t bytes) { reportProgress(bytes); });
    }

    ctx.progress->completeFile(local.key);
}
