#include "sync/tasks/Download.hpp"
#include "sync/Progress.hpp"
#include "storage/Client.hpp"
#include "log/Registry.hpp"

using namespace zs;
using namespace zs::sync::tasks;

Download::Download(Context& ctx, concurrency::AdmissionGate::Slot slot, model::DownloadItem item)
    : Transfer(ctx, std::move(slot)), item(std::move(item)) {}

void Download::transfer() {
    const auto& remote = item.remote;

    ctx.progress->addToTotalBytes(remote.size_bytes);
    ctx.progress->startFile(remote.key, remote.size_bytes);

    if (ctx.dry_run) {
        log::Registry::sync()->info("[DRY RUN] Would download {}", remote.key);
    } else {
        log::Registry::sync()->debug("[DOWNLOAD] {} -> {}", remote.key, item.target.absolute_path.string());
        ctx.client->download(remote.key, item.target.absolute_path,
                             [this](const uintmax_t bytes) { reportProgress(bytes); });
    }

    ctx.progress->completeFile(remote.key);
}
