#include "core/parallel.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using resilab::core::ParallelForEach;
using resilab::core::ThreadJoiner;

TEST_CASE("ParallelForEach visits every index exactly once", "[core][parallel]") {
  std::vector<std::atomic<int>> visits(97);
  ParallelForEach(visits.size(), 4, [&visits](std::size_t i) { ++visits[i]; });
  for (const auto& count : visits) {
    REQUIRE(count.load() == 1);
  }
}

TEST_CASE("ParallelForEach counts the caller as a worker", "[core][parallel]") {
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  ParallelForEach(24, 3, [&](std::size_t) {
    const int now = ++active;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    --active;
  });
  REQUIRE(peak.load() >= 1);
  REQUIRE(peak.load() <= 3);
}

TEST_CASE("ParallelForEach with one worker stays on the calling thread", "[core][parallel]") {
  const auto caller = std::this_thread::get_id();
  bool all_on_caller = true;
  ParallelForEach(5, 1, [&](std::size_t) {
    all_on_caller = all_on_caller && std::this_thread::get_id() == caller;
  });
  REQUIRE(all_on_caller);
}

TEST_CASE("ThreadJoiner joins a running thread while unwinding", "[core][parallel]") {
  std::atomic<bool> finished{false};
  try {
    std::thread worker([&finished]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      finished.store(true);
    });
    ThreadJoiner joiner(worker);
    throw std::runtime_error("collector failed mid-window");
  } catch (const std::runtime_error&) {
  }
  REQUIRE(finished.load());
}

TEST_CASE("ThreadJoiner leaves an already joined thread alone", "[core][parallel]") {
  std::thread worker([]() {});
  {
    ThreadJoiner joiner(worker);
    worker.join();
  }
  REQUIRE_FALSE(worker.joinable());
}
