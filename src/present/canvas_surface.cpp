#include "present/surface.hpp"

#include <opencv2/imgproc.hpp>

namespace toon {

CanvasSurface::CanvasSurface(cv::Size fixed_size) : fixed_size_(fixed_size) {}

void CanvasSurface::on_source_resized(cv::Size native) {
  source_size_ = native;
  const cv::Size size = fixed_size_.empty() ? native : fixed_size_;
  if (size.empty()) {
    canvas_.release();
    return;
  }

  presented_size_ = native;
  plane_scale_ = ComputeLetterbox(native, size);
  plane_rect_ = LetterboxRect(size, plane_scale_);
  canvas_.create(size, CV_8UC4);
  canvas_.setTo(cv::Scalar(0, 0, 0, 255));
}

void CanvasSurface::reset() {
  source_size_ = cv::Size();
  presented_size_ = cv::Size();
  plane_scale_ = PlaneScale{};
  plane_rect_ = cv::Rect();
  canvas_.release();
}

void CanvasSurface::present(const cv::Mat& frame) {
  if (!valid() || frame.empty()) return;

  cv::Mat bgra = frame;
  if (frame.type() == CV_8UC3) cv::cvtColor(frame, bgra, cv::COLOR_BGR2BGRA);
  CV_Assert(bgra.type() == CV_8UC4);

  // Frames already at surface size (GPU output renders its own letterbox) are copied as-is
  if (bgra.size() == canvas_.size()) {
    bgra.copyTo(canvas_);
    return;
  }

  // The plane follows the presented frame's own shape. A frame that already carries bars
  // (fixed GPU output size) is fitted whole rather than stretched to the source aspect
  if (bgra.size() != presented_size_) {
    presented_size_ = bgra.size();
    plane_scale_ = ComputeLetterbox(presented_size_, canvas_.size());
    plane_rect_ = LetterboxRect(canvas_.size(), plane_scale_);
  }

  canvas_.setTo(cv::Scalar(0, 0, 0, 255));
  cv::Mat plane = canvas_(plane_rect_);
  cv::resize(bgra, plane, plane_rect_.size(), 0, 0, cv::INTER_NEAREST);
}

} // namespace toon
