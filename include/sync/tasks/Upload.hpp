#pragma once

#include "sync/tasks/Transfer.hpp"
#include "sync/model/Plan.hpp"

namespace zs::sync::tasks {

struct Upload final : Transfer {
    model::UploadItem item;

    Upload(Context& ctx, concurrency::AdmissionGate::Slot slot, model::UploadItem item);

    [[nodiscard]] const util::ObjectKey& key() const override { return item.local.key; }

protected:
    void transfer() override;
    [[nodiscard]] const char* label() const override { return "UploadTask"; }
};

}
