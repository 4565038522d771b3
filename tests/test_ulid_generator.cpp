#include "uidkit/core/clock.h"
#include "uidkit/entropy/entropy_source.h"
#include "uidkit/ulid/ulid_generator.h"

#include "test_doubles.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace uidkit;

namespace {

std::string must_generate(ulid::UlidGenerator& gen) {
  auto id = gen.generate();
  REQUIRE(id.has_value());
  return id.value();
}

}  // namespace

TEST_CASE("UlidGenerator: ids are 26 characters from the fixed alphabet", "[ulid][generator]") {
  core::SystemClock clock;
  entropy::SystemEntropySource source;
  ulid::UlidGenerator gen(clock, source);

  for (int i = 0; i < 100; ++i) {
    const std::string id = must_generate(gen);
    REQUIRE(id.size() == 26);
    for (const char ch : id) {
      REQUIRE(ulid::kEncoding.find(ch) != std::string_view::npos);
    }
  }
}

TEST_CASE("UlidGenerator: sequential ids never decrease", "[ulid][generator][monotonic]") {
  core::SystemClock clock;
  entropy::SystemEntropySource source;
  ulid::UlidGenerator gen(clock, source);

  std::vector<std::string> ids;
  ids.reserve(1000);
  for (int i = 0; i < 1000; ++i) {
    ids.push_back(must_generate(gen));
    // Mix same-millisecond and cross-millisecond pairs.
    if (i % 100 == 0) {
      std::this_thread::sleep_for(std::chrono::microseconds(500));
    }
  }

  CHECK(std::is_sorted(ids.begin(), ids.end()));
}

TEST_CASE("UlidGenerator: ids within one millisecond strictly increase and share a timestamp",
          "[ulid][generator][monotonic]") {
  core::ManualClock clock(1759248000000);
  entropy::SystemEntropySource source;
  ulid::UlidGenerator gen(clock, source);

  std::string previous = must_generate(gen);
  const std::string prefix = previous.substr(0, 10);
  for (int i = 0; i < 1000; ++i) {
    const std::string next = must_generate(gen);
    REQUIRE(next.substr(0, 10) == prefix);
    REQUIRE(previous < next);
    previous = next;
  }
}

TEST_CASE("UlidGenerator: embedded timestamp is the clock reading", "[ulid][generator]") {
  core::ManualClock clock(1469918176385);
  testing::CountingEntropySource source;
  ulid::UlidGenerator gen(clock, source);

  const auto id = gen.generate_ulid();
  REQUIRE(id.has_value());
  CHECK(id.value().timestamp_ms() == 1469918176385ULL);
  CHECK(ulid::encode_ulid(id.value()).substr(0, 10) == "01ARYZ6S41");
}

TEST_CASE("UlidGenerator: 100,000 sequential ids are unique", "[ulid][generator][uniqueness]") {
  core::SystemClock clock;
  entropy::SystemEntropySource source;
  ulid::UlidGenerator gen(clock, source);

  constexpr int kCount = 100000;
  std::unordered_set<std::string> seen;
  seen.reserve(kCount);
  for (int i = 0; i < kCount; ++i) {
    REQUIRE(seen.insert(must_generate(gen)).second);
  }
  CHECK(seen.size() == static_cast<std::size_t>(kCount));
}

TEST_CASE("UlidGenerator: concurrent callers get unique ids", "[ulid][generator][concurrency]") {
  core::SystemClock clock;
  entropy::SystemEntropySource source;
  ulid::UlidGenerator gen(clock, source);

  constexpr int kThreads = 8;
  constexpr int kPerThread = 12500;

  std::vector<std::vector<std::string>> per_thread(kThreads);
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&gen, &out = per_thread[t]] {
      out.reserve(kPerThread);
      for (int i = 0; i < kPerThread; ++i) {
        auto id = gen.generate();
        // Record failures as empty strings; checked on the main thread.
        out.push_back(id.has_value() ? id.value() : std::string{});
      }
    });
  }
  for (auto& w : workers) {
    w.join();
  }

  std::unordered_set<std::string> seen;
  seen.reserve(kThreads * kPerThread);
  for (const auto& ids : per_thread) {
    // Each thread observes its own ids in non-decreasing order.
    CHECK(std::is_sorted(ids.begin(), ids.end()));
    for (const auto& id : ids) {
      REQUIRE_FALSE(id.empty());
      REQUIRE(seen.insert(id).second);
    }
  }
  CHECK(seen.size() == static_cast<std::size_t>(kThreads * kPerThread));
}

TEST_CASE("UlidGenerator: secure source failure is returned to the caller",
          "[ulid][generator][errors]") {
  core::ManualClock clock(1000);
  testing::FailingEntropySource source;
  ulid::UlidGenerator gen(clock, source);

  const auto id = gen.generate();
  REQUIRE_FALSE(id.has_value());
  CHECK(id.error() == core::GenerationError::kEntropyUnavailable);
}

TEST_CASE("UlidGenerator: source failing mid-millisecond is reported",
          "[ulid][generator][errors]") {
  core::ManualClock clock(1000);
  testing::FailingEntropySource source(1);  // only the fresh draw succeeds
  ulid::UlidGenerator gen(clock, source);

  REQUIRE(gen.generate().has_value());
  const auto id = gen.generate();
  REQUIRE_FALSE(id.has_value());
  CHECK(id.error() == core::GenerationError::kEntropyUnavailable);
}

TEST_CASE("UlidGenerator: entropy exhaustion is reported distinctly", "[ulid][generator][errors]") {
  core::ManualClock clock(1000);
  testing::QueueEntropySource source;
  source.then(0xFF, 10).then(0x00, 4);
  ulid::UlidGenerator gen(clock, source);

  const auto first = gen.generate();
  REQUIRE(first.has_value());
  CHECK(first.value() == "00000000Z8ZZZZZZZZZZZZZZZZ");

  const auto second = gen.generate();
  REQUIRE_FALSE(second.has_value());
  CHECK(second.error() == core::GenerationError::kEntropyExhausted);
}

TEST_CASE("UlidGenerator: clock outside the 48-bit range is rejected",
          "[ulid][generator][errors]") {
  testing::CountingEntropySource source;

  SECTION("beyond the maximum timestamp") {
    core::ManualClock clock(static_cast<std::int64_t>(ulid::kMaxTimestampMs) + 1);
    ulid::UlidGenerator gen(clock, source);
    const auto id = gen.generate();
    REQUIRE_FALSE(id.has_value());
    CHECK(id.error() == core::GenerationError::kTimestampOverflow);
  }

  SECTION("before the Unix epoch") {
    core::ManualClock clock(-1);
    ulid::UlidGenerator gen(clock, source);
    const auto id = gen.generate();
    REQUIRE_FALSE(id.has_value());
    CHECK(id.error() == core::GenerationError::kTimestampOverflow);
  }
}
