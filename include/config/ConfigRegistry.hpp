#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace zs::config {

class ConfigRegistry {
public:
    static void init(Config config);
    static const Config& get();
    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::mutex mutex_;
};

} // namespace zs::config
