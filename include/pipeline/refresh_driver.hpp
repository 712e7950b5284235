#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>

/*
    RefreshDriver is the display-refresh callback abstraction the scheduler runs on:
    request_tick() registers a callback for the next refresh and returns its id,
    cancel_tick() removes a registration that has not fired yet.

    DisplayRefreshDriver is the production driver. The main loop calls pump(), which waits for
    the next refresh deadline and then fires every callback registered before it. Callbacks
    registered while firing wait for the following refresh. A refresh rate of 0 means unpaced.
*/

namespace toon {

class RefreshDriver {
public:
  using TickId = std::uint64_t;
  using Callback = std::function<void()>;

  virtual ~RefreshDriver() = default;

  virtual TickId request_tick(Callback cb) = 0;
  virtual void cancel_tick(TickId id) = 0;
};

class DisplayRefreshDriver final : public RefreshDriver {
public:
  explicit DisplayRefreshDriver(int refresh_hz);

  TickId request_tick(Callback cb) override;
  void cancel_tick(TickId id) override;

  // Sleeps until the next refresh, then fires due callbacks. Returns how many fired
  std::size_t pump();

  std::size_t pending() const { return callbacks_.size(); }

private:
  std::chrono::steady_clock::duration period_{};
  std::chrono::steady_clock::time_point next_refresh_{};
  std::map<TickId, Callback> callbacks_;
  TickId next_id_{1};
};

} // namespace toon
