#include "sync/Engine.hpp"
#include "sync/Executor.hpp"
#include "sync/Inventory.hpp"
#include "sync/Progress.hpp"
#include "storage/Client.hpp"
#include "storage/errors.hpp"
#include "util/hash.hpp"
#include "log/Registry.hpp"

using namespace zs;
using namespace zs::sync;
using namespace zs::sync::model;
using namespace std::chrono;

namespace fs = std::filesystem;

Engine::Engine(config::Config cfg, std::shared_ptr<storage::Client> client, Digester digest)
    : cfg_(std::move(cfg)),
      client_(std::move(client)),
      digest_(digest ? std::move(digest) : Digester(&util::sha256File)),
      progress_(std::make_shared<Progress>()),
      remoteBase_(util::remoteBasePath(cfg_.storage.zone, cfg_.sync.remote_path)) {
    if (!client_) throw std::invalid_argument("Engine requires a storage client");
}

void Engine::logHeader() const {
    const auto logger = log::Registry::zonesync();
    const auto& s = cfg_.sync;

    logger->info("Starting sync: {}", s.direction == Direction::Upload ? "Local -> Storage Zone" : "Storage Zone -> Local");
    logger->info("Local Path: {}", s.local_path.string());
    logger->info("Storage Zone: {}", cfg_.storage.zone);
    logger->info("Region: {}", cfg_.storage.region.empty() ? "de" : cfg_.storage.region);
    if (!util::trimSlashes(s.remote_path).empty()) logger->info("Remote Path: /{}", util::trimSlashes(s.remote_path));
    if (s.dry_run) logger->warn("DRY RUN MODE - No changes will be made");
}

namespace {
PlanOptions makePlanOptions(const config::Config& cfg, const util::ObjectKey& base) {
    return {
        .direction = cfg.sync.direction,
        .tiers = TierRules::fromPatterns(cfg.sync.upload_last),
        .local_root = cfg.sync.local_path,
        .remote_base = base
    };
}
}

TransferPlan Engine::planUpload() {
    const auto logger = log::Registry::zonesync();

    const auto local = Inventory::buildLocal(cfg_.sync.local_path, remoteBase_);
    logger->info("Found {} local file(s)", local.size());

    const auto remote = Inventory::buildRemote(*client_, remoteBase_);
    logger->info("Found {} remote file(s)", remote.size());

    return Planner::build(local, remote, makePlanOptions(cfg_, remoteBase_), digest_);
}

TransferPlan Engine::planDownload() {
    const auto logger = log::Registry::zonesync();
    const auto& root = cfg_.sync.local_path;

    std::error_code ec;
    const bool rootExists = fs::is_directory(root, ec);
    if (!rootExists && !cfg_.sync.dry_run) {
        fs::create_directories(root, ec);
        if (ec) throw storage::LocalIOError(root.string(), "Cannot create " + root.string() + ": " + ec.message());
        log::Registry::storage()->info("[Engine] Created local directory {}", root.string());
    }

    const auto remote = Inventory::buildRemote(*client_, remoteBase_);
    logger->info("Found {} remote file(s)", remote.size());

    // A dry run never creates the root, so a missing one is simply empty.
    const auto local = rootExists || !cfg_.sync.dry_run ? Inventory::buildLocal(root, remoteBase_) : LocalInventory{};
    logger->info("Found {} local file(s)", local.size());

    return Planner::build(local, remote, makePlanOptions(cfg_, remoteBase_), digest_);
}

Summary Engine::run() {
    const auto started = steady_clock::now();
    const auto& s = cfg_.sync;

    logHeader();

    const auto plan = s.direction == Direction::Upload ? planUpload() : planDownload();

    Summary summary;
    summary.direction = s.direction;
    summary.dry_run = s.dry_run;
    summary.skipped = plan.skipped.size();

    progress_->addToTotalFiles(plan.transferCount());

    log::Registry::zonesync()->info("Syncing files (parallel: {})...", s.parallel);

    Executor executor(client_, progress_, {
        .parallel = s.parallel,
        .failure_policy = s.failure_policy,
        .dry_run = s.dry_run
    });

    Executor::Result transferred;
    if (s.direction == Direction::Upload) {
        for (const auto tier : TIER_ORDER) {
            const auto& items = plan.tier(tier);
            if (items.empty()) continue;
            log::Registry::sync()->debug("[Engine] Tier {}: {} file(s)", to_string(tier), items.size());
            transferred += executor.run(items); // returns only once the whole tier has finished
        }
    } else {
        transferred = executor.run(plan.downloads);
    }

    summary.transferred = transferred.succeeded;
    summary.failed = transferred.failed;
    summary.skipped += transferred.skipped;
    summary.bytes_transferred = transferred.bytes;

    if (!plan.deletes.empty()) {
        log::Registry::zonesync()->info("Cleaning up deleted files...");
        const auto removed = executor.remove(plan.deletes, s.deletion_policy, s.local_path);
        summary.deleted = removed.deleted;
        summary.delete_failed = removed.failed;
    }

    summary.elapsed = duration_cast<milliseconds>(steady_clock::now() - started);
    log::Registry::zonesync()->info("{}", summary.toString());
    return summary;
}
