#ifndef RESILAB_CORE_PARALLEL_HPP_
#define RESILAB_CORE_PARALLEL_HPP_

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <system_error>
#include <thread>
#include <vector>

namespace resilab::core {

// Runs `fn(index)` for every index in [0, count) on at most `max_workers`
// threads, the calling thread included. Work is handed out through a shared
// counter, so completion order is unspecified. `fn` must not throw.
//
// If the system refuses to start a helper thread, the threads already running
// and the caller finish the work. Restore paths rely on this: they run from
// destructors and must not throw.
template <typename Fn>
void ParallelForEach(std::size_t count, std::size_t max_workers, Fn fn) {
  if (count == 0U) {
    return;
  }
  const std::size_t workers = std::max<std::size_t>(1U, std::min(count, max_workers));

  std::atomic<std::size_t> next{0};
  const auto drain = [&next, &fn, count]() {
    for (;;) {
      const std::size_t index = next.fetch_add(1U, std::memory_order_relaxed);
      if (index >= count) {
        return;
      }
      fn(index);
    }
  };

  std::vector<std::thread> helpers;
  helpers.reserve(workers - 1U);
  try {
    for (std::size_t w = 1; w < workers; ++w) {
      helpers.emplace_back(drain);
    }
  } catch (const std::system_error&) {
    // Fewer helpers than asked for; the caller picks up the slack below.
  }
  drain();
  for (auto& helper : helpers) {
    helper.join();
  }
}

// Joins `thread` on scope exit unless it was joined already, so an exception
// between spawn and join unwinds instead of calling std::terminate.
class ThreadJoiner {
public:
  explicit ThreadJoiner(std::thread& thread) : thread_(thread) {}
  ~ThreadJoiner() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  ThreadJoiner(const ThreadJoiner&) = delete;
  ThreadJoiner& operator=(const ThreadJoiner&) = delete;

private:
  std::thread& thread_;
};

} // namespace resilab::core

#endif // RESILAB_CORE_PARALLEL_HPP_
