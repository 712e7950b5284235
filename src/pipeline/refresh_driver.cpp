#include "pipeline/refresh_driver.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace toon {

DisplayRefreshDriver::DisplayRefreshDriver(int refresh_hz) {
  if (refresh_hz > 0) {
    period_ = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / static_cast<double>(refresh_hz)));
  }
}

RefreshDriver::TickId DisplayRefreshDriver::request_tick(Callback cb) {
  const TickId id = next_id_++;
  callbacks_.emplace(id, std::move(cb));
  return id;
}

void DisplayRefreshDriver::cancel_tick(TickId id) {
  callbacks_.erase(id);
}

std::size_t DisplayRefreshDriver::pump() {
  using clock = std::chrono::steady_clock;

  if (period_ > clock::duration::zero()) {
    const auto now = clock::now();
    if (next_refresh_ > now) std::this_thread::sleep_until(next_refresh_);
    // Fall back onto the cadence instead of bursting after a long frame
    next_refresh_ = std::max(next_refresh_ + period_, clock::now());
  }

  // Only callbacks registered before this refresh are due. Each one is looked up again right
  // before it fires, so a cancel from an earlier callback in the same refresh still applies
  const TickId last_due = next_id_ - 1;
  std::size_t fired = 0;
  while (!callbacks_.empty() && callbacks_.begin()->first <= last_due) {
    auto it = callbacks_.begin();
    Callback cb = std::move(it->second);
    callbacks_.erase(it);
    cb();
    ++fired;
  }
  return fired;
}

} // namespace toon
