#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace zs::config {

void ConfigRegistry::init(Config config) {
    std::scoped_lock lock(mutex_);
    config_ = std::move(config);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace zs::config
