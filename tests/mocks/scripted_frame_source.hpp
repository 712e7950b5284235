#pragma once

#include <cstdint>

#include <opencv2/core.hpp>

#include "core/frame.hpp"
#include "io/frame_source.hpp"

namespace mocks {

// Frame source whose readiness and frame content the test controls
class ScriptedFrameSource : public toon::FrameSource {
public:
  explicit ScriptedFrameSource(cv::Size size = cv::Size(8, 6), cv::Scalar fill = cv::Scalar(200, 200, 200, 255))
      : size_(size), fill_(fill) {}

  bool ready() const override { return ready_; }

  bool read(toon::Frame& out) override {
    ++reads_;
    if (!ready_) return false;
    out.capture_time = toon::TimePoint::clock::now();
    out.sequence_id = next_id_++;
    out.image = cv::Mat(size_, CV_8UC4, fill_);
    return true;
  }

  void set_ready(bool v) { ready_ = v; }
  void set_size(cv::Size s) { size_ = s; }
  void set_fill(cv::Scalar f) { fill_ = f; }

  int reads() const { return reads_; }

private:
  cv::Size size_;
  cv::Scalar fill_;
  bool ready_{true};
  int reads_{0};
  std::uint64_t next_id_{0};
};

} // namespace mocks
