#include "present/window_surface.hpp"

#include <iostream>
#include <utility>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace toon {

static const cv::Size kIdleSize(640, 360);

WindowSurface::WindowSurface(std::string window_name, cv::Size fixed_size, std::chrono::milliseconds notice_lifetime)
    : CanvasSurface(fixed_size), window_name_(std::move(window_name)), notice_(notice_lifetime) {
  cv::namedWindow(window_name_, cv::WINDOW_AUTOSIZE);
}

WindowSurface::~WindowSurface() {
  cv::destroyWindow(window_name_);
}

void WindowSurface::present(const cv::Mat& frame) {
  CanvasSurface::present(frame);
  refresh();
}

void WindowSurface::refresh() {
  if (valid()) {
    canvas().copyTo(display_);
  } else {
    display_.create(kIdleSize, CV_8UC4);
    display_.setTo(cv::Scalar(0, 0, 0, 255));
    cv::putText(display_, "Press SPACE to start the camera", cv::Point(20, kIdleSize.height / 2),
                cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(255, 255, 255, 255), 1, cv::LINE_AA);
  }

  notice_.draw(display_);
  cv::imshow(window_name_, display_);
}

void WindowSurface::show_notice(const std::string& text) {
  std::cerr << text << "\n";
  notice_.show(text);
  refresh();
}

} // namespace toon
