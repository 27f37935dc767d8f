#include "core/interrupt.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace resilab::core {

namespace {

constexpr std::chrono::milliseconds kSleepSlice{100};

void HandleInterruptSignal(int /*signal_number*/) {
  InterruptFlag().store(true, std::memory_order_relaxed);
}

} // namespace

std::atomic<bool>& InterruptFlag() {
  static std::atomic<bool> flag{false};
  return flag;
}

bool InterruptRequested() {
  return InterruptFlag().load(std::memory_order_relaxed);
}

void InstallInterruptHandlers() {
  std::signal(SIGINT, HandleInterruptSignal);
  std::signal(SIGTERM, HandleInterruptSignal);
}

bool SleepFor(std::chrono::milliseconds duration, const std::atomic<bool>* cancel) {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  while (true) {
    if (cancel != nullptr && cancel->load(std::memory_order_relaxed)) {
      return false;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(remaining, kSleepSlice));
  }
}

} // namespace resilab::core
