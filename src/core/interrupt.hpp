#pragma once

#include <atomic>
#include <chrono>

namespace resilab::core {

// Process-wide interrupt flag set from SIGINT/SIGTERM. Long waits poll it so
// an operator can cut a window short; cleanup paths never consult it.
std::atomic<bool>& InterruptFlag();

bool InterruptRequested();

// Installs SIGINT/SIGTERM handlers that only set `InterruptFlag()`.
void InstallInterruptHandlers();

// Sleeps for `duration` in short slices. Returns false if `cancel` (when
// non-null) became true before the full duration elapsed.
bool SleepFor(std::chrono::milliseconds duration, const std::atomic<bool>* cancel);

} // namespace resilab::core

