#include "chronoid/codec/bit_codec.h"
#include "chronoid/core/clock.h"
#include "chronoid/core/entropy.h"
#include "chronoid/core/errors.h"
#include "chronoid/core/time.h"
#include "chronoid/extract/extract.h"
#include "chronoid/generator/generator.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace chronoid;

TEST_CASE("Generator output is strictly increasing", "[generator][monotonic]") {
  SECTION("many identifiers within one frozen millisecond") {
    core::FixedClock clock(1738934578991ULL);
    core::OpenSslEntropySource entropy;
    generator::Generator gen(clock, entropy);

    auto previous = gen.generate();
    for (int i = 0; i < 10000; ++i) {
      const auto next = gen.generate();
      REQUIRE(previous < next);
      REQUIRE(extract::extract_timestamp(next) == 1738934578991ULL);
      previous = next;
    }
  }

  SECTION("across advancing milliseconds, text order agrees") {
    core::FixedClock clock(1000);
    core::OpenSslEntropySource entropy;
    generator::Generator gen(clock, entropy);

    auto previous = gen.generate_string();
    for (int i = 0; i < 500; ++i) {
      if (i % 7 == 0) {
        clock.advance(1);
      }
      const auto next = gen.generate_string();
      REQUIRE(previous < next);
      previous = next;
    }
  }
}

TEST_CASE("Generator holds its timestamp while the clock runs backwards",
          "[generator][rollback]") {
  core::FixedClock clock(50000);
  core::OpenSslEntropySource entropy;
  generator::Generator gen(clock, entropy);

  auto previous = gen.generate();
  for (std::uint64_t now = 49990; now > 49900; now -= 10) {
    clock.set(now);
    const auto next = gen.generate();
    CHECK(extract::extract_timestamp(next) == 50000);
    CHECK(previous < next);
    previous = next;
  }
}

TEST_CASE("Generator output carries version 7 and the RFC variant", "[generator]") {
  core::SystemClock clock;
  core::OpenSslEntropySource entropy;
  generator::Generator gen(clock, entropy);

  for (int i = 0; i < 200; ++i) {
    const auto text = gen.generate_string();
    REQUIRE(text.size() == 36);
    CHECK(text[14] == '7');
    CHECK(std::string("89ab").find(text[19]) != std::string::npos);
    CHECK(codec::parse(text, codec::Validation::kStrict).has_value());
  }
}

TEST_CASE("Generator is deterministic for scripted inputs", "[generator]") {
  core::FixedClock clock(1738934578991ULL);
  core::ScriptedEntropySource entropy;
  entropy.push({0x0B, 0x1C, 0x00, 0x00, 0x3A, 0x4D, 0x3F, 0x15, 0x1D, 0x8E});
  entropy.push({0x00, 0x00, 0x00, 0x00});
  generator::Generator gen(clock, entropy);

  CHECK(gen.generate_string() == "0194e093-ef2f-7b1c-8000-3a4d3f151d8e");
  CHECK(gen.generate_string() == "0194e093-ef2f-7b1c-8000-3a4d3f151d8f");
  CHECK(gen.state() == generator::GeneratorState{1738934578991ULL, 2844, 14925, 1058348431});
}

TEST_CASE("Generator draws entropy exactly once per call", "[generator]") {
  constexpr int kIncrements = 64;
  core::FixedClock clock(5000);
  core::ScriptedEntropySource entropy;
  entropy.push({0x00, 0x01, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x03});
  for (int i = 0; i < kIncrements; ++i) {
    entropy.push({0x00, 0x00, 0x00, 0x00});
  }
  generator::Generator gen(clock, entropy);

  for (int i = 0; i <= kIncrements; ++i) {
    REQUIRE_NOTHROW(gen.generate());
  }
  CHECK(entropy.remaining() == 0);
  CHECK(gen.state() == generator::GeneratorState{5000, 1, 2, 3 + kIncrements});
}

TEST_CASE("Generator failures leave the state unchanged", "[generator][errors]") {
  SECTION("entropy unavailable") {
    core::FixedClock clock(1000);
    core::ScriptedEntropySource entropy;
    generator::Generator gen(clock, entropy);

    CHECK_THROWS_AS(gen.generate(), core::EntropyError);
    CHECK(gen.state() == generator::GeneratorState{});

    entropy.push(std::vector<std::uint8_t>(generator::kReseedBytes, 0x00));
    CHECK(codec::format(gen.generate()) == "00000000-03e8-7000-8000-000000000000");
  }

  SECTION("clock beyond the 48-bit range") {
    core::FixedClock clock(1ULL << 48);
    core::OpenSslEntropySource entropy;
    generator::Generator gen(clock, entropy);

    CHECK_THROWS_AS(gen.generate(), core::ClockError);
    CHECK(gen.state() == generator::GeneratorState{});
  }
}

TEST_CASE("Generator stays monotonic under concurrent callers", "[generator][concurrency]") {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 2000;

  core::FixedClock clock(1738934578991ULL);
  core::OpenSslEntropySource entropy;
  generator::Generator gen(clock, entropy);

  std::vector<std::vector<codec::Uuid>> results(kThreads);
  std::vector<std::thread> threads;
  threads.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&gen, &results, &clock, t] {
      auto& out = results[static_cast<std::size_t>(t)];
      out.reserve(kPerThread);
      for (int i = 0; i < kPerThread; ++i) {
        if (t == 0 && i % 500 == 0) {
          clock.advance(1);
        }
        out.push_back(gen.generate());
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  std::set<codec::Uuid> all;
  for (const auto& per_thread : results) {
    // Each caller observes its own results in increasing order.
    CHECK(std::is_sorted(per_thread.begin(), per_thread.end()));
    CHECK(std::adjacent_find(per_thread.begin(), per_thread.end()) == per_thread.end());
    all.insert(per_thread.begin(), per_thread.end());
  }
  CHECK(all.size() == static_cast<std::size_t>(kThreads * kPerThread));

  // The final published state is the maximum ever produced.
  CHECK(codec::pack(gen.state()) == *all.rbegin());
}

TEST_CASE("make_generator returns independent generators", "[generator]") {
  auto gen1 = generator::make_generator();
  auto gen2 = generator::make_generator();
  REQUIRE(gen1 != nullptr);
  REQUIRE(gen2 != nullptr);

  const auto u1a = gen1->generate();
  const auto u1b = gen1->generate();
  const auto u2a = gen2->generate();

  CHECK(u1a < u1b);
  CHECK(u1a != u2a);
  CHECK(gen1->state() != gen2->state());
}

TEST_CASE("default generate() tracks the wall clock", "[generator]") {
  const auto before = static_cast<std::uint64_t>(core::to_unix_millis(core::now_utc()));
  const auto u1 = generator::generate();
  const auto u2 = generator::generate();
  const auto after = static_cast<std::uint64_t>(core::to_unix_millis(core::now_utc()));

  CHECK(u1 < u2);
  CHECK(&generator::default_generator() == &generator::default_generator());

  const auto ts = extract::extract_timestamp(u1);
  // The stored timestamp may run ahead of the clock only after rollback or overflow.
  CHECK(ts + 5000 >= before);
  CHECK(ts <= after + 5000);
}
