#include "puid/core/base36.h"
#include "puid/core/process_id.h"
#include "puid/core/random_source.h"
#include "puid/generator/id_generator.h"

#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace puid;

namespace {

constexpr std::uint64_t kFixedMillis = 1651312057000ull;
constexpr std::uint64_t kFixedPid = 4242;

bool is_base36(const std::string& s) {
  return !s.empty() && s.find_first_not_of(core::kBase36Digits) == std::string::npos;
}

}  // namespace

TEST_CASE("generate_id: prefix, separator and base-36 body", "[generator][format]") {
  const auto id = generator::generate_id("foo");

  const auto sep = id.find('_');
  REQUIRE(sep != std::string::npos);
  CHECK(id.substr(0, sep) == "foo");
  // Exactly one separator.
  CHECK(id.find('_', sep + 1) == std::string::npos);

  const auto body = id.substr(sep + 1);
  REQUIRE(body.size() > generator::kDefaultRandomLength);
  const auto numeric = body.substr(0, body.size() - generator::kDefaultRandomLength);
  const auto random = body.substr(body.size() - generator::kDefaultRandomLength);
  CHECK(is_base36(numeric));
  CHECK(random.find_first_not_of(core::kAlphanumeric) == std::string::npos);
}

TEST_CASE("generate_id: random suffix length", "[generator][format]") {
  core::FixedClock clock(kFixedMillis);
  core::SequenceCounter counter;
  core::FixedProcessIdSource pids(kFixedPid);
  core::ThreadLocalRandomSource random;
  generator::GeneratorServices services{clock, counter, pids, random};
  generator::IdGenerator gen(services);

  const std::string deterministic_prefix =
      "x_" + core::to_base36(kFixedMillis) + "0" + core::to_base36(kFixedPid);

  SECTION("ten characters") {
    const auto id = gen.generate("x", 10);
    REQUIRE(id.size() == deterministic_prefix.size() + 10);
    CHECK(id.starts_with(deterministic_prefix));
    CHECK(id.substr(deterministic_prefix.size()).find_first_not_of(core::kAlphanumeric) ==
          std::string::npos);
  }

  SECTION("zero characters ends right after the pid") {
    const auto id = gen.generate("x", 0);
    CHECK(id == deterministic_prefix);
  }

  SECTION("process-wide generator honours the length too") {
    // Without a random suffix the body is base-36 only.
    const auto id = generator::generate_id("x", 0);
    CHECK(is_base36(id.substr(2)));
  }
}

TEST_CASE("IdGenerator: compose exposes each segment", "[generator]") {
  core::FixedClock clock(kFixedMillis);
  core::SequenceCounter counter(35);
  core::FixedProcessIdSource pids(kFixedPid);
  core::SeededRandomSource random(7);
  generator::GeneratorServices services{clock, counter, pids, random};
  generator::IdGenerator gen(services);

  const auto parts = gen.compose("bar", 24);
  CHECK(parts.prefix == "bar");
  CHECK(parts.time == core::to_base36(kFixedMillis));
  CHECK(parts.counter == "z");
  CHECK(parts.pid == core::to_base36(kFixedPid));
  CHECK(parts.random.size() == 24);
  CHECK(parts.str() == "bar_" + parts.time + "z" + parts.pid + parts.random);

  // The counter advanced exactly once.
  CHECK(gen.compose("bar", 0).counter == "10");
}

TEST_CASE("IdGenerator: identical timestamp, counter and pid give identical segments",
          "[generator][determinism]") {
  core::FixedClock clock(kFixedMillis);
  core::FixedProcessIdSource pids(kFixedPid);
  core::ThreadLocalRandomSource random;

  core::SequenceCounter counter_a(17);
  core::SequenceCounter counter_b(17);
  generator::GeneratorServices services_a{clock, counter_a, pids, random};
  generator::GeneratorServices services_b{clock, counter_b, pids, random};
  generator::IdGenerator gen_a(services_a);
  generator::IdGenerator gen_b(services_b);

  const auto a = gen_a.compose("foo", 24);
  const auto b = gen_b.compose("foo", 24);
  CHECK(a.deterministic_body() == b.deterministic_body());
  CHECK(a.random != b.random);
}

TEST_CASE("IdGenerator: identical collaborators compose identical IDs", "[generator][determinism]") {
  core::FixedClock clock(kFixedMillis);
  core::FixedProcessIdSource pids(kFixedPid);

  core::SequenceCounter counter_a(200);
  core::SequenceCounter counter_b(200);
  core::SeededRandomSource random_a(99);
  core::SeededRandomSource random_b(99);
  generator::GeneratorServices services_a{clock, counter_a, pids, random_a};
  generator::GeneratorServices services_b{clock, counter_b, pids, random_b};
  generator::IdGenerator gen_a(services_a);
  generator::IdGenerator gen_b(services_b);

  const auto a = gen_a.compose("foo", 16);
  const auto b = gen_b.compose("foo", 16);
  CHECK(a == b);
  CHECK(a.str() == b.str());

  // Counters advance in lockstep; a different prefix breaks equality.
  CHECK_FALSE(gen_a.compose("foo", 16) == gen_b.compose("bar", 16));
}

TEST_CASE("IdGenerator: concurrent callers in one clock tick get distinct IDs",
          "[generator][concurrency]") {
  core::FixedClock clock(kFixedMillis);
  core::SequenceCounter counter;
  core::FixedProcessIdSource pids(kFixedPid);
  core::ThreadLocalRandomSource random;
  generator::GeneratorServices services{clock, counter, pids, random};
  generator::IdGenerator gen(services);

  constexpr std::size_t kCallers = 256;
  std::vector<std::string> ids(kCallers);
  std::vector<std::thread> threads;
  threads.reserve(kCallers);
  for (std::size_t i = 0; i < kCallers; ++i) {
    threads.emplace_back([&gen, &ids, i] { ids[i] = gen.generate("job", 0); });
  }
  for (auto& th : threads) {
    th.join();
  }

  const std::set<std::string> unique(ids.begin(), ids.end());
  CHECK(unique.size() == kCallers);
}

TEST_CASE("IdGenerator: invalid prefix fails fast", "[generator][error]") {
  core::FixedClock clock(kFixedMillis);
  core::SequenceCounter counter;
  core::FixedProcessIdSource pids(kFixedPid);
  core::ThreadLocalRandomSource random;
  generator::GeneratorServices services{clock, counter, pids, random};
  generator::IdGenerator gen(services);

  CHECK_THROWS_AS(gen.generate(""), std::invalid_argument);
  CHECK_THROWS_AS(gen.generate("a_b"), std::invalid_argument);
  CHECK_THROWS_AS(gen.generate("toolongprefix"), std::invalid_argument);

  // Rejected calls do not consume a counter value.
  CHECK(counter.peek() == 0);
}

TEST_CASE("generate_id: uses the real process id", "[generator]") {
  const auto id = generator::generate_id("pid", 0);
  CHECK(id.ends_with(core::to_base36(core::current_process_id())));
}

TEST_CASE("generate_id: throughput", "[generator][.benchmark]") {
  BENCHMARK("create puid") { return generator::generate_id("test"); };
}
