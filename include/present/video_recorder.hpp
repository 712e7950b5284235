#pragma once

#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "core/config.hpp"

namespace toon {

/*
    Records presented frames into a take. A take is written to a temporary file next to the
    capture directory; save() renames it to "<prefix>-<epoch_ms><ext>", discard() deletes it.

    States: idle -> recording (start) -> pending (stop) -> idle (save | discard).
    Starting a new take while one is pending discards the pending one.
*/
class VideoRecorder {
public:
  VideoRecorder(RecordingConfig rec, CaptureConfig capture);
  ~VideoRecorder();

  VideoRecorder(const VideoRecorder&) = delete;
  VideoRecorder& operator=(const VideoRecorder&) = delete;

  // Throws std::runtime_error if the writer cannot be opened
  void start(cv::Size frame_size);
  void write(const cv::Mat& frame);
  void stop();

  // Returns the saved path. Throws std::runtime_error without a pending take
  std::string save();
  void discard();

  bool recording() const { return writer_.isOpened(); }
  bool has_pending_take() const { return !recording() && !take_path_.empty(); }
  int frames_written() const { return frames_; }

private:
  RecordingConfig rec_;
  CaptureConfig capture_;
  cv::VideoWriter writer_;
  cv::Size frame_size_{};
  std::string take_path_;
  int frames_{0};
};

} // namespace toon
