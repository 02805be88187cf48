#pragma once

#include "config/Config.hpp"
#include "sync/Planner.hpp"
#include "sync/model/Summary.hpp"

#include <memory>

namespace zs::storage { class Client; }

namespace zs::sync {

class Progress;

// One sync run: inventories, plan, tiered transfers, then the deletion pass.
class Engine {
public:
    Engine(config::Config cfg, std::shared_ptr<storage::Client> client, Digester digest = {});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Throws on fatal errors: missing local root, listing failure, and
    // TransferFailed under the fail-fast policy. Deletions never run after a throw.
    model::Summary run();

    // Live feed for renderers; valid for the lifetime of the engine.
    [[nodiscard]] std::shared_ptr<Progress> progress() const { return progress_; }

    [[nodiscard]] const util::ObjectKey& remoteBase() const { return remoteBase_; }

private:
    void logHeader() const;

    model::TransferPlan planUpload();
    model::TransferPlan planDownload();

    config::Config cfg_;
    std::shared_ptr<storage::Client> client_;
    Digester digest_;
    std::shared_ptr<Progress> progress_;
    util::ObjectKey remoteBase_;
};

}
