#pragma once

#include <atomic>
#include <cstdint>

#include "core/config.hpp"
#include "core/frame.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"
#include "io/frame_source.hpp"

namespace toon {

enum class AcquisitionStatus {
  Stopped,
  Opening,
  Streaming,
  Denied // Device missing, busy, or permission refused
};

/*
    Live camera source. A capture thread opens the device (or cfg.source when set), requests
    the configured size and publishes each decoded frame, converted to BGRA, into a LatestStore.
    read() hands the scheduler the newest frame it has not seen yet, so a slow camera read never
    blocks a display tick and a frame is never stylized twice. Between camera frames (or after a
    file source ends) the source reports not ready and the tick is skipped.
*/
class CameraSource final : public FrameSource {
public:
  explicit CameraSource(CameraConfig cfg, StageMetrics* metrics = nullptr);
  ~CameraSource() override;

  CameraSource(const CameraSource&) = delete;
  CameraSource& operator=(const CameraSource&) = delete;

  void start(StopToken global_stop);
  void stop();

  bool ready() const override;
  bool read(Frame& out) override;

  AcquisitionStatus status() const { return status_.load(std::memory_order_acquire); }

private:
  void run(const StopToken& global_stop, const std::atomic_bool& local_stop);

  CameraConfig cfg_;
  StageMetrics* metrics_;
  ThreadRunner runner_;
  LatestStore<Frame> latest_;
  std::atomic<AcquisitionStatus> status_{AcquisitionStatus::Stopped};
  std::uint64_t next_id_{0};
  std::uint64_t seen_version_{0}; // Store version last handed out by read()
};

} // namespace toon
