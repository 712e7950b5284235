#include "io/video_file_source.hpp"

#include <chrono>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace toon {

VideoFileSource::VideoFileSource(const std::string& path) : cap_(path) {
  if (!cap_.isOpened()) {
    throw std::runtime_error("Failed to open video file '" + path + "'");
  }
}

bool VideoFileSource::read(Frame& out) {
  if (!ready()) return false;

  cv::Mat img;
  if (!cap_.read(img) || img.empty()) {
    exhausted_ = true;
    return false;
  }

  out.capture_time = std::chrono::steady_clock::now();
  out.sequence_id = next_id_++;
  cv::cvtColor(img, out.image, img.channels() == 1 ? cv::COLOR_GRAY2BGRA : cv::COLOR_BGR2BGRA);
  return true;
}

double VideoFileSource::fps() const {
  const double f = cap_.get(cv::CAP_PROP_FPS);
  return f > 0.0 ? f : 30.0;
}

} // namespace toon
