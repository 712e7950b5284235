#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

#include <opencv2/core.hpp>

#include "infra/metrics.hpp"
#include "io/frame_source.hpp"
#include "pipeline/refresh_driver.hpp"
#include "present/surface.hpp"
#include "stylize/stylizer.hpp"

/*
    FrameScheduler drives source -> stylizer -> surface once per display refresh while streaming.

    States: Idle, Running.
      Idle    -> Running  start(): the first tick is requested immediately
      Running -> Running  tick(): a frame is processed or the tick is skipped; either way the
                          next tick is requested after this one finishes
      Running -> Idle     stop() or destruction: the pending tick registration is cancelled

    At most one tick is ever registered, so at most one stylization pass is in flight.
    A tick that fires while Idle does nothing. Nothing thrown by the stylizer leaves tick().
*/

namespace toon {

enum class SchedulerState {
  Idle,
  Running
};

struct SchedulerStats {
  std::uint64_t ticks{0};
  std::uint64_t presented{0};
  std::uint64_t skipped{0};   // Source or surface not ready
  std::uint64_t failures{0};  // Stylizer threw, raw frame presented
  std::uint64_t resizes{0};   // Native size changes seen
};

class FrameScheduler {
public:
  using PresentedFn = std::function<void(const cv::Mat&)>;

  FrameScheduler(FrameSource& source, Stylizer& stylizer, PresentationSurface& surface,
                 RefreshDriver& driver, StageMetrics* metrics = nullptr);
  ~FrameScheduler();

  FrameScheduler(const FrameScheduler&) = delete;
  FrameScheduler& operator=(const FrameScheduler&) = delete;

  void start();
  void stop();
  void tick();

  SchedulerState state() const { return state_; }
  bool running() const { return state_ == SchedulerState::Running; }
  bool has_pending_tick() const { return pending_.has_value(); }
  const SchedulerStats& stats() const { return stats_; }

  // Called with the surface canvas after every present
  void set_on_presented(PresentedFn fn) { on_presented_ = std::move(fn); }

private:
  void schedule_next();
  void on_refresh(std::uint64_t gen);
  void skip();

  FrameSource& source_;
  Stylizer& stylizer_;
  PresentationSurface& surface_;
  RefreshDriver& driver_;
  StageMetrics* metrics_;

  SchedulerState state_{SchedulerState::Idle};
  std::optional<RefreshDriver::TickId> pending_;
  std::uint64_t generation_{0};
  cv::Size native_size_{};
  SchedulerStats stats_{};
  PresentedFn on_presented_;
};

} // namespace toon
