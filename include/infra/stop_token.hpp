#pragma once

#include <atomic>

namespace toon {

class StopSource;

// Read-only view of a StopSource. A default token is never stopped.
// Tokens point into their source, so the source must outlive every token taken from it
class StopToken {
public:
  StopToken() = default;

  bool stop_requested() const {
    return flag_ != nullptr && flag_->load(std::memory_order_acquire);
  }

private:
  friend class StopSource;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  const std::atomic_bool* flag_{nullptr};
};

// Process-wide shutdown flag, owned by main(). Raised on quit or SIGINT and seen by the
// capture thread through its token; a per-thread stop goes through ThreadRunner instead
class StopSource {
public:
  StopSource() = default;

  StopSource(const StopSource&) = delete;
  StopSource& operator=(const StopSource&) = delete;

  StopToken token() const { return StopToken(&stopped_); }

  void request_stop() { stopped_.store(true, std::memory_order_release); }
  bool stop_requested() const { return stopped_.load(std::memory_order_acquire); }

private:
  std::atomic_bool stopped_{false};
};

} // namespace toon
