//  Libbyteconv - culture-aware byte formatting and parsing.
//  Copyright (C) 2026 Yaroslav Gorbunov
//
//  Thread safety tests for the process-wide current conventions snapshot.
//  Separated into its own binary so TSan can validate these tests in CI
//  (label "thread_safety").

#define BOOST_TEST_MODULE conventions_thread_safety_test

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "libbyteconv/byte.h"
#include "test_utils.h"

using namespace byteconv;

BOOST_AUTO_TEST_SUITE(conventions_thread_safety)

// Verify concurrent set_current/current are race-free and never tear a snapshot
BOOST_AUTO_TEST_CASE(concurrent_set_current_no_race)
{
  byteconv::test::CurrentConventionsGuard guard;

  constexpr size_t NUM_WRITERS = 4;
  constexpr size_t NUM_READERS = 4;
  constexpr size_t ITERATIONS = 20000;

  auto custom = byteconv::test::make_custom_conventions();

  std::atomic<bool> stop{false};
  std::atomic<size_t> reads{0};
  // BOOST_CHECK is not thread-safe; capture first torn snapshot via atomic instead
  std::atomic<bool> torn{false};

  // Writers alternate between the custom profile and the invariant one
  auto writer = [&](bool start_custom) {
    bool use_custom = start_custom;
    for (size_t i = 0; i < ITERATIONS; ++i) {
      if (use_custom)
        Numeric_conventions::set_current(custom);
      else
        Numeric_conventions::set_current(nullptr);
      use_custom = !use_custom;
    }
  };

  // A snapshot must be entirely one profile or the other
  auto reader = [&]() {
    do {
      auto c = Numeric_conventions::current();
      const bool is_custom = c->decimal_separator() == "~";
      const bool consistent = is_custom
        ? (c->negative_sign() == "#" && c->group_separator() == "*")
        : (c->negative_sign() == "-" && c->group_separator() == ",");
      if (!consistent)
        torn.store(true, std::memory_order_relaxed);
      reads.fetch_add(1, std::memory_order_relaxed);
    } while (!stop.load(std::memory_order_acquire));
  };

  std::vector<std::thread> threads;
  threads.reserve(NUM_WRITERS + NUM_READERS);

  for (size_t i = 0; i < NUM_READERS; ++i)
    threads.emplace_back(reader);
  for (size_t i = 0; i < NUM_WRITERS; ++i)
    threads.emplace_back(writer, i % 2 == 0);

  // Wait for writers to finish
  for (size_t i = NUM_READERS; i < threads.size(); ++i)
    threads[i].join();

  stop.store(true, std::memory_order_release);
  for (size_t i = 0; i < NUM_READERS; ++i)
    threads[i].join();

  // Assert after all threads joined (BOOST_CHECK is not thread-safe)
  BOOST_CHECK(!torn.load());
  BOOST_CHECK_GT(reads.load(), 0u);
  THREAD_SAFE_TEST_MESSAGE("set_current race test: " +
    std::to_string(reads.load()) + " reads completed");
}

// Formatting with the current snapshot while it is being swapped
BOOST_AUTO_TEST_CASE(concurrent_format_while_switching)
{
  byteconv::test::CurrentConventionsGuard guard;

  constexpr size_t NUM_FORMATTERS = 4;
  constexpr size_t ITERATIONS = 20000;

  auto custom = byteconv::test::make_custom_conventions();

  std::atomic<bool> stop{false};
  std::atomic<size_t> formatted{0};
  std::atomic<bool> bad_output{false};

  auto switcher = [&]() {
    for (size_t i = 0; i < ITERATIONS; ++i)
      Numeric_conventions::set_current(i % 2 ? custom : nullptr);
  };

  auto formatter = [&]() {
    do {
      std::string s = Byte(24).to_string("N");
      if (s != "24.00" && s != "24~00")
        bad_output.store(true, std::memory_order_relaxed);

      Byte parsed;
      if (!Byte::try_parse("200", parsed) || parsed.value() != 200)
        bad_output.store(true, std::memory_order_relaxed);

      formatted.fetch_add(1, std::memory_order_relaxed);
    } while (!stop.load(std::memory_order_acquire));
  };

  std::vector<std::thread> threads;
  threads.reserve(NUM_FORMATTERS);
  for (size_t i = 0; i < NUM_FORMATTERS; ++i)
    threads.emplace_back(formatter);

  std::thread writer(switcher);
  writer.join();

  stop.store(true, std::memory_order_release);
  for (auto& t: threads)
    t.join();

  BOOST_CHECK(!bad_output.load());
  BOOST_CHECK_GT(formatted.load(), 0u);
  THREAD_SAFE_TEST_MESSAGE("format race test: " +
    std::to_string(formatted.load()) + " conversions completed");
}

BOOST_AUTO_TEST_SUITE_END()
