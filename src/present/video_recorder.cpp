#include "present/video_recorder.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <opencv2/imgproc.hpp>

#include "present/still_capture.hpp"

namespace toon {

VideoRecorder::VideoRecorder(RecordingConfig rec, CaptureConfig capture)
    : rec_(std::move(rec)), capture_(std::move(capture)) {}

VideoRecorder::~VideoRecorder() {
  stop();
  discard();
}

void VideoRecorder::start(cv::Size frame_size) {
  if (recording()) return;
  discard();

  std::filesystem::create_directories(capture_.output_dir);
  take_path_ = (std::filesystem::path(capture_.output_dir) /
                (".take-" + std::to_string(EpochMs()) + rec_.extension)).string();

  const int fourcc = cv::VideoWriter::fourcc(rec_.fourcc[0], rec_.fourcc[1], rec_.fourcc[2], rec_.fourcc[3]);
  if (!writer_.open(take_path_, fourcc, static_cast<double>(rec_.fps), frame_size, true)) {
    take_path_.clear();
    throw std::runtime_error("Could not open video writer (" + rec_.fourcc + ", " + rec_.extension + ")");
  }

  frame_size_ = frame_size;
  frames_ = 0;
  std::cout << "recording started " << frame_size.width << "x" << frame_size.height << std::endl;
}

void VideoRecorder::write(const cv::Mat& frame) {
  if (!recording() || frame.empty()) return;

  cv::Mat bgr;
  if (frame.type() == CV_8UC4) {
    cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
  } else {
    bgr = frame;
  }

  // The writer's size is fixed per take; a mid-take source switch is scaled to fit
  if (bgr.size() != frame_size_) cv::resize(bgr, bgr, frame_size_, 0, 0, cv::INTER_NEAREST);

  writer_.write(bgr);
  ++frames_;
}

void VideoRecorder::stop() {
  if (!recording()) return;
  writer_.release();
  std::cout << "recording stopped (" << frames_ << " frames)" << std::endl;
}

std::string VideoRecorder::save() {
  if (!has_pending_take()) throw std::runtime_error("No recording to save");

  const std::filesystem::path dst =
      std::filesystem::path(capture_.output_dir) / CaptureFileName(capture_.prefix, EpochMs(), rec_.extension);
  std::filesystem::rename(take_path_, dst);
  take_path_.clear();
  return dst.string();
}

void VideoRecorder::discard() {
  if (recording() || take_path_.empty()) return;

  std::error_code ec;
  std::filesystem::remove(take_path_, ec);
  if (ec) std::cerr << "Could not remove take '" << take_path_ << "': " << ec.message() << "\n";
  take_path_.clear();
}

} // namespace toon
