#pragma once

#include <cstdint>
#include <string>

#include <opencv2/videoio.hpp>

#include "io/frame_source.hpp"

namespace toon {

// Sequential source for offline replay: every read() decodes the next frame of the file,
// so no frame is skipped regardless of tick pacing
class VideoFileSource final : public FrameSource {
public:
  explicit VideoFileSource(const std::string& path);

  bool ready() const override { return cap_.isOpened() && !exhausted_; }
  bool read(Frame& out) override;

  bool exhausted() const { return exhausted_; }
  double fps() const;
  std::uint64_t frames_read() const { return next_id_; }

private:
  cv::VideoCapture cap_;
  bool exhausted_{false};
  std::uint64_t next_id_{0};
};

} // namespace toon
