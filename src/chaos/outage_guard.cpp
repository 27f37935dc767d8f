#include "chaos/outage_guard.hpp"

#include "core/parallel.hpp"

#include <utility>

namespace resilab::chaos {

OutageGuard::OutageGuard(fleet::IContainerPlatform& platform, core::logging::Logger& logger,
                         std::size_t fan_out, std::vector<ContainerFailure>& restore_failures)
    : platform_(platform), logger_(logger), fan_out_(fan_out),
      restore_failures_(restore_failures) {}

OutageGuard::~OutageGuard() {
  Restore();
}

void OutageGuard::Arm(std::vector<std::string> victims) {
  victims_ = std::move(victims);
  armed_ = !victims_.empty();
}

void OutageGuard::RecordFailure(const std::string& container, const char* operation,
                                const std::string& error) {
  logger_.Warn("restore step failed",
               {{"container", container}, {"operation", operation}, {"error", error}});
  std::lock_guard<std::mutex> lock(failures_mu_);
  restore_failures_.push_back({container, operation, error});
}

void OutageGuard::Restore() {
  if (!armed_) {
    return;
  }
  armed_ = false;

  core::ParallelForEach(victims_.size(), fan_out_, [this](std::size_t i) {
    const std::string& container = victims_[i];
    std::string error;
    if (!platform_.Start(container, error)) {
      RecordFailure(container, "start", error);
    }
    if (!platform_.SetRestartPolicy(container, fleet::RestartPolicy::kUnlessStopped, error)) {
      RecordFailure(container, "update", error);
    }
  });

  logger_.Debug("victims restored", {{"count", std::to_string(victims_.size())}});
  victims_.clear();
}

} // namespace resilab::chaos
