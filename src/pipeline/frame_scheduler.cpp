#include "pipeline/frame_scheduler.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace toon {

FrameScheduler::FrameScheduler(FrameSource& source, Stylizer& stylizer, PresentationSurface& surface,
                               RefreshDriver& driver, StageMetrics* metrics)
    : source_(source), stylizer_(stylizer), surface_(surface), driver_(driver), metrics_(metrics) {}

FrameScheduler::~FrameScheduler() {
  stop();
}

void FrameScheduler::start() {
  if (state_ == SchedulerState::Running) return;

  state_ = SchedulerState::Running;
  native_size_ = cv::Size(); // First frame always re-sizes the surface
  std::cout << "scheduler started (" << stylizer_.name() << ")" << std::endl;
  schedule_next();
}

void FrameScheduler::stop() {
  if (state_ == SchedulerState::Idle) return;

  state_ = SchedulerState::Idle;
  ++generation_;
  if (pending_) {
    driver_.cancel_tick(*pending_);
    pending_.reset();
  }
  std::cout << "scheduler stopped" << std::endl;
}

void FrameScheduler::schedule_next() {
  if (state_ != SchedulerState::Running || pending_) return;
  const std::uint64_t gen = ++generation_;
  pending_ = driver_.request_tick([this, gen] { on_refresh(gen); });
}

void FrameScheduler::on_refresh(std::uint64_t gen) {
  if (gen != generation_) return; // A cancelled registration fired anyway
  pending_.reset();
  tick();
}

void FrameScheduler::skip() {
  ++stats_.skipped;
  if (metrics_) metrics_->on_skip();
  schedule_next();
}

void FrameScheduler::tick() {
  if (state_ != SchedulerState::Running) return;

  ++stats_.ticks;

  if (!source_.ready()) {
    skip();
    return;
  }

  Frame frame;
  if (!source_.read(frame) || frame.image.empty()) {
    skip();
    return;
  }

  // Surface and stylizer must see the new size before any pixel work on it
  if (frame.image.size() != native_size_) {
    native_size_ = frame.image.size();
    ++stats_.resizes;
    surface_.on_source_resized(native_size_);
    std::cout << "source resolution " << native_size_.width << "x" << native_size_.height << std::endl;
  }

  if (!surface_.valid()) {
    skip();
    return;
  }

  const auto t0 = NowNs();

  cv::Mat out;
  try {
    out = stylizer_.stylize(frame.image);
  } catch (const std::exception& e) {
    std::cerr << "scheduler: stylize failed on frame " << frame.sequence_id << ", presenting raw frame: "
              << e.what() << "\n";
    ++stats_.failures;
    if (metrics_) metrics_->on_failure();
    out = frame.image;
  }

  try {
    surface_.present(out);
    ++stats_.presented;
    if (metrics_) metrics_->on_item(NowNs() - t0);

    if (on_presented_) on_presented_(surface_.canvas());
  } catch (const std::exception& e) {
    std::cerr << "scheduler: present failed on frame " << frame.sequence_id << ": " << e.what() << "\n";
    ++stats_.failures;
    if (metrics_) metrics_->on_failure();
  }

  schedule_next();
}

} // namespace toon
