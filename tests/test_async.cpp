#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/utils/async.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using voice_bridge::utils::TaskGroup;

TEST_CASE("task group close waits for running tasks") {
    std::atomic<bool> finished{false};
    TaskGroup group;
    REQUIRE(group.spawn([&finished]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        finished = true;
    }, "slow"));

    group.close_and_wait();
    REQUIRE(finished);
    REQUIRE(group.active() == 0);
}

TEST_CASE("a closed task group refuses new tasks") {
    TaskGroup group;
    group.close_and_wait();
    std::atomic<int> calls{0};

    REQUIRE(group.closed());
    REQUIRE_FALSE(group.spawn([&calls]() { ++calls; }, "late"));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(calls == 0);
}

TEST_CASE("a throwing task still releases the group") {
    TaskGroup group;
    REQUIRE(group.spawn([]() { throw std::runtime_error("boom"); }, "failing"));
    group.close_and_wait();
    REQUIRE(group.active() == 0);
}

TEST_CASE("a hold keeps the group busy until released") {
    TaskGroup group;
    auto hold = group.hold();
    REQUIRE(group.active() == 1);

    std::atomic<bool> closed{false};
    std::thread closer([&]() {
        group.close_and_wait();
        closed = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE_FALSE(closed);

    hold.reset();
    closer.join();
    REQUIRE(closed);
}
