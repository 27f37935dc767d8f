#pragma once

#include "chaos/chaos_window.hpp"
#include "core/logging/logger.hpp"
#include "fleet/platform.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace resilab::chaos {

// Restores stopped victims exactly once.
//
// The executor arms the guard with the kill set before the first stop command
// is issued. Every exit path out of the window (normal completion, interrupt,
// early return) then ends with the victims started again and their restart
// policy reset to `unless-stopped`.
class OutageGuard {
public:
  OutageGuard(fleet::IContainerPlatform& platform, core::logging::Logger& logger,
              std::size_t fan_out, std::vector<ContainerFailure>& restore_failures);
  ~OutageGuard();

  OutageGuard(const OutageGuard&) = delete;
  OutageGuard& operator=(const OutageGuard&) = delete;
  OutageGuard(OutageGuard&&) = delete;
  OutageGuard& operator=(OutageGuard&&) = delete;

  void Arm(std::vector<std::string> victims);

  // Starts every victim and re-enables auto-restart. Idempotent. Failures are
  // logged and recorded, never fatal.
  void Restore();

  bool armed() const {
    return armed_;
  }

private:
  void RecordFailure(const std::string& container, const char* operation,
                     const std::string& error);

  fleet::IContainerPlatform& platform_;
  core::logging::Logger& logger_;
  std::size_t fan_out_ = 4;
  std::vector<ContainerFailure>& restore_failures_;
  std::vector<std::string> victims_;
  bool armed_ = false;
  std::mutex failures_mu_;
};

} // namespace resilab::chaos
