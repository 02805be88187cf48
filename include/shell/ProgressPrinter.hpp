#pragma once

#include "sync/Progress.hpp"

#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace zs::shell {

// Console view over Progress snapshots: one status line plus the busiest transfers.
class ProgressPrinter {
public:
    static constexpr size_t DEFAULT_MAX_FILES = 10;

    explicit ProgressPrinter(std::FILE* out = stdout, size_t maxFiles = DEFAULT_MAX_FILES);

    // Sampler callback. Redraws in place on a terminal, silent otherwise.
    void operator()(const sync::ProgressSnapshot& snap);

    // Leaves the last frame on screen, or prints the status line when not on a terminal.
    void finish(const sync::ProgressSnapshot& snap);

    [[nodiscard]] static std::string statusLine(const sync::ProgressSnapshot& snap);
    [[nodiscard]] static std::vector<std::string> render(const sync::ProgressSnapshot& snap, size_t width, size_t maxFiles);

private:
    std::FILE* out_;
    size_t maxFiles_;
    bool tty_;
    size_t drawnLines_ = 0;
    std::mutex mutex_;
};

}
