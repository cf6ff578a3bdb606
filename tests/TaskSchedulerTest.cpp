#include <catch2/catch_test_macros.hpp>
#include "util/TaskScheduler.h"
#include <atomic>
#include <stdexcept>

using Marquee::Util::TaskScheduler;

//==============================================================================
TEST_CASE("TaskScheduler", "[TaskScheduler]") {
  SECTION("explicit worker count") {
    TaskScheduler scheduler(3);
    REQUIRE(scheduler.getWorkerCount() == 3);
  }

  SECTION("schedule returns the task's result") {
    TaskScheduler scheduler(2);
    auto future = scheduler.schedule<int>([]() { return 6 * 7; });
    REQUIRE(future.get() == 42);
  }

  SECTION("exceptions reach the future") {
    TaskScheduler scheduler(1);
    auto future = scheduler.schedule<int>([]() -> int { throw std::runtime_error("bad"); });
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }

  SECTION("background tasks all run") {
    TaskScheduler scheduler(4);
    std::atomic<int> counter{0};

    for (int i = 0; i < 100; ++i)
      REQUIRE(scheduler.scheduleBackground([&]() { counter++; }));

    REQUIRE(scheduler.waitForAll(5000));
    REQUIRE(counter.load() == 100);
  }

  SECTION("a throwing background task does not kill the worker") {
    TaskScheduler scheduler(1);
    std::atomic<bool> ran{false};

    scheduler.scheduleBackground([]() { throw std::runtime_error("oops"); });
    scheduler.scheduleBackground([&]() { ran = true; });

    REQUIRE(scheduler.waitForAll(5000));
    REQUIRE(ran.load());
  }

  SECTION("a background task throwing a non-exception type does not kill the worker") {
    TaskScheduler scheduler(1);
    std::atomic<bool> ran{false};

    scheduler.scheduleBackground([]() { throw 42; });
    scheduler.scheduleBackground([&]() { ran = true; });

    REQUIRE(scheduler.waitForAll(5000));
    REQUIRE(ran.load());
  }

  SECTION("shutdown drains queued work and rejects new work") {
    TaskScheduler scheduler(1);
    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i)
      scheduler.scheduleBackground([&]() { counter++; });

    scheduler.shutdown();
    REQUIRE(scheduler.isShutdown());
    REQUIRE(counter.load() == 10);

    REQUIRE_FALSE(scheduler.scheduleBackground([]() {}));
    auto rejected = scheduler.schedule<int>([]() { return 1; });
    REQUIRE_THROWS_AS(rejected.get(), std::runtime_error);
  }
}
