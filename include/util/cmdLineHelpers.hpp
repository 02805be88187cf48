#pragma once

#include <sys/ioctl.h>
#include <unistd.h>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <fmt/core.h>

namespace zs::shell {

inline int term_width() {
    if (!isatty(STDOUT_FILENO)) return 80;
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
    if (const char* c = std::getenv("COLUMNS")) { const int n = std::atoi(c); if (n > 0) return n; }
    return 80;
}

inline std::string human_bytes(const uint64_t b) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    int u = 0;
    auto v = static_cast<double>(b);
    while (v >= 1024.0 && u < 5) { v /= 1024.0; ++u; }
    if (u == 0) return fmt::format("{} {}", b, kUnits[u]);
    return fmt::format("{:.1f} {}", v, kUnits[u]);
}

inline std::string human_rate(const double bytesPerSecond) {
    return human_bytes(static_cast<uint64_t>(bytesPerSecond)) + "/s";
}

inline std::string ellipsize_middle(std::string s, const size_t maxw) {
    if (s.size() <= maxw || maxw < 5) return s;
    const size_t keep = (maxw - 3) / 2;
    const size_t tail = maxw - 3 - keep;
    return s.substr(0, keep) + "..." + s.substr(s.size() - tail);
}

}
