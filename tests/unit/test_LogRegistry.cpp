#include <gtest/gtest.h>
#include "log/Registry.hpp"

using namespace zs;

TEST(LogRegistryTest, SubsystemLoggersAreRegistered) {
    ASSERT_TRUE(log::Registry::isInitialized());
    for (const auto* name : {"zonesync", "sync", "cloud", "storage", "progress", "audit"})
        EXPECT_NE(log::Registry::get(name), nullptr) << name;
}

TEST(LogRegistryTest, UnknownLoggerThrows) {
    EXPECT_THROW((void)log::Registry::get("no-such-logger"), std::runtime_error);
}

// stdout belongs to the progress display; console logging goes to stderr.
TEST(LogRegistryTest, ConsoleSinkWritesToStderr) {
    for (const auto& logger : {log::Registry::zonesync(), log::Registry::sync(), log::Registry::cloud()}) {
        ASSERT_FALSE(logger->sinks().empty());
        EXPECT_NE(std::dynamic_pointer_cast<spdlog::sinks::stderr_color_sink_mt>(logger->sinks().front()), nullptr)
            << logger->name();
        for (const auto& sink : logger->sinks())
            EXPECT_EQ(std::dynamic_pointer_cast<spdlog::sinks::stdout_color_sink_mt>(sink), nullptr) << logger->name();
    }
}
