#pragma once

#include "sync/tasks/Transfer.hpp"
#include "sync/model/Plan.hpp"

namespace zs::sync::tasks {

struct Download final : Transfer {
    model::DownloadItem item;

    Download(Context& ctx, concurrency::AdmissionGate::Slot slot, model::DownloadItem item);

    [[nodiscard]] const util::ObjectKey& key() const override { return item.remote.key; }

protected:
    void transfer() override;
    [[nodiscard]] const char* label() const override { return "DownloadTask"; }
};

}
