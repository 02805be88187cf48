#include <gtest/gtest.h>
#include "concurrency/AdmissionGate.hpp"
#include "concurrency/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace zs::concurrency;
using namespace std::chrono_literals;

namespace {
struct CountingTask final : PromisedTask {
    std::atomic<int>& counter;
    explicit CountingTask(std::atomic<int>& c) : counter(c) {}
    void operator()() override {
        ++counter;
        promise.set_value(true);
    }
};
}

TEST(AdmissionGateTest, ZeroLimitIsRejected) {
    EXPECT_THROW(AdmissionGate(0), std::invalid_argument);
}

TEST(AdmissionGateTest, SlotReleasesOnDestruction) {
    AdmissionGate gate(2);
    {
        auto a = gate.enter();
        auto b = gate.enter();
        EXPECT_EQ(gate.inFlight(), 2u);
    }
    EXPECT_EQ(gate.inFlight(), 0u);
}

TEST(AdmissionGateTest, MovedSlotReleasesOnce) {
    AdmissionGate gate(1);
    {
        auto a = gate.enter();
        auto b = std::move(a);
        EXPECT_EQ(gate.inFlight(), 1u);
    }
    EXPECT_EQ(gate.inFlight(), 0u);
}

TEST(AdmissionGateTest, ReleaseWithoutAcquireThrows) {
    AdmissionGate gate(1);
    EXPECT_THROW(gate.release(), std::logic_error);
}

TEST(AdmissionGateTest, NeverExceedsLimit) {
    constexpr size_t limit = 3;
    AdmissionGate gate(limit);
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            const auto slot = gate.enter();
            const int now = ++inside;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(5ms);
            --inside;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(peak.load(), static_cast<int>(limit));
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(gate.inFlight(), 0u);
}

TEST(AdmissionGateTest, DrainWaitsForOutstandingSlots) {
    AdmissionGate gate(2);
    std::atomic<bool> released{false};

    auto slot = std::make_unique<AdmissionGate::Slot>(gate.enter());
    std::thread t([&] {
        std::this_thread::sleep_for(20ms);
        released = true;
        slot.reset();
    });

    gate.drain();
    EXPECT_TRUE(released.load());
    t.join();
}

TEST(ThreadPoolTest, RunsSubmittedTasks) {
    std::atomic<int> counter{0};
    ThreadPool pool(4);
    EXPECT_EQ(pool.workerCount(), 4u);

    std::vector<std::future<ExpectedFuture>> futures;
    for (int i = 0; i < 20; ++i) {
        auto task = std::make_shared<CountingTask>(counter);
        futures.push_back(std::move(*task->getFuture()));
        pool.submit(task);
    }
    for (auto& f : futures) EXPECT_TRUE(f.get());
    EXPECT_EQ(counter.load(), 20);
}

TEST(ThreadPoolTest, SubmitAfterStopThrows) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    pool.stop();
    EXPECT_THROW(pool.submit(std::make_shared<CountingTask>(counter)), std::runtime_error);
}
