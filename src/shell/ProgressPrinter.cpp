#include "shell/ProgressPrinter.hpp"
#include "util/cmdLineHelpers.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <unistd.h>

using namespace zs;
using namespace zs::shell;

namespace {
std::string mmss(const std::chrono::milliseconds elapsed) {
    const auto secs = elapsed.count() / 1000;
    return fmt::format("{:02}:{:02}", secs / 60, secs % 60);
}

unsigned int percentOf(const uintmax_t part, const uintmax_t whole) {
    return whole ? static_cast<unsigned int>(part * 100 / whole) : 100;
}
}

ProgressPrinter::ProgressPrinter(std::FILE* out, const size_t maxFiles)
    : out_(out), maxFiles_(maxFiles), tty_(isatty(fileno(out)) != 0) {}

std::string ProgressPrinter::statusLine(const sync::ProgressSnapshot& snap) {
    return fmt::format("[{:5.1f}%] {}/{} files  {} / {}  {}  {}",
                       snap.percent, snap.completed_files, snap.total_files,
                       human_bytes(snap.completed_bytes), human_bytes(snap.total_bytes),
                       human_rate(snap.bytes_per_second), mmss(snap.elapsed));
}

std::vector<std::string> ProgressPrinter::render(const sync::ProgressSnapshot& snap, const size_t width, const size_t maxFiles) {
    std::vector<std::string> lines{statusLine(snap)};

    const size_t keyWidth = width > 40 ? width - 32 : 8;
    for (size_t i = 0; i < snap.files.size() && i < maxFiles; ++i) {
        const auto& f = snap.files[i];
        const auto key = ellipsize_middle(f.key, keyWidth);
        if (f.completed)
            lines.push_back(fmt::format("  done {:<{}} {:>10}", key, keyWidth, human_bytes(f.total_bytes)));
        else
            lines.push_back(fmt::format("  {:>3}% {:<{}} {:>12}", percentOf(f.transferred_bytes, f.total_bytes),
                                        key, keyWidth, human_rate(f.bytes_per_second)));
    }

    return lines;
}

void ProgressPrinter::operator()(const sync::ProgressSnapshot& snap) {
    if (!tty_) return;

    const auto lines = render(snap, static_cast<size_t>(term_width()), maxFiles_);

    std::scoped_lock lock(mutex_);
    if (drawnLines_) fmt::print(out_, "\x1b[{}F", drawnLines_);
    for (const auto& l : lines) fmt::print(out_, "\x1b[2K{}\n", l);
    for (size_t i = lines.size(); i < drawnLines_; ++i) fmt::print(out_, "\x1b[2K\n");
    drawnLines_ = std::max(drawnLines_, lines.size());
    std::fflush(out_);
}

void ProgressPrinter::finish(const sync::ProgressSnapshot& snap) {
    std::scoped_lock lock(mutex_);
    if (!tty_) fmt::print(out_, "{}\n", statusLine(snap));
    drawnLines_ = 0;
    std::fflush(out_);
}
