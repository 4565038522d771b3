#include "uidkit/core/clock.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>

using namespace uidkit;
using namespace std::chrono_literals;

namespace {

std::int64_t system_millis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

TEST_CASE("ManualClock: reads the value it was given", "[core][clock]") {
  core::ManualClock clock(1759248000000);
  CHECK(clock.now_unix_millis() == 1759248000000);

  clock.set_millis(42);
  CHECK(clock.now_unix_millis() == 42);
}

TEST_CASE("ManualClock: advance moves time forward without counting as sleep",
          "[core][clock]") {
  core::ManualClock clock(1000);
  clock.advance(250ms);
  CHECK(clock.now_unix_millis() == 1250);
  CHECK(clock.total_slept() == 0ms);
}

TEST_CASE("ManualClock: sleep_for advances time and accumulates the sleep total",
          "[core][clock]") {
  core::ManualClock clock(1000);
  clock.sleep_for(30ms);
  clock.sleep_for(12ms);
  CHECK(clock.now_unix_millis() == 1042);
  CHECK(clock.total_slept() == 42ms);
}

TEST_CASE("ManualClock: can be moved backward", "[core][clock]") {
  core::ManualClock clock(1000);
  clock.set_millis(900);
  CHECK(clock.now_unix_millis() == 900);
}

TEST_CASE("SystemClock: tracks std::chrono::system_clock", "[core][clock]") {
  core::SystemClock clock;

  const std::int64_t before = system_millis();
  const std::int64_t reading = clock.now_unix_millis();
  const std::int64_t after = system_millis();

  CHECK(reading >= before);
  CHECK(reading <= after);
}

TEST_CASE("SystemClock: sleep_for blocks at least the requested time", "[core][clock]") {
  core::SystemClock clock;

  const auto start = std::chrono::steady_clock::now();
  clock.sleep_for(5ms);
  CHECK(std::chrono::steady_clock::now() - start >= 5ms);
}
