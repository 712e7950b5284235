#include "apps/notice_overlay.hpp"

#include <algorithm>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace toon {

NoticeOverlay::NoticeOverlay(std::chrono::milliseconds lifetime) : lifetime_(lifetime) {}

void NoticeOverlay::show(std::string text, Clock::time_point now) {
  text_ = std::move(text);
  expires_ = now + lifetime_;
}

void NoticeOverlay::clear() {
  text_.clear();
  expires_ = Clock::time_point{};
}

bool NoticeOverlay::active(Clock::time_point now) const {
  return !text_.empty() && now < expires_;
}

void NoticeOverlay::draw(cv::Mat& img, Clock::time_point now) const {
  if (!active(now) || img.empty()) return;

  const int font = cv::FONT_HERSHEY_SIMPLEX;
  const double scale = 0.6;
  const int thickness = 1;
  const int margin = 8;

  int baseline = 0;
  const cv::Size ts = cv::getTextSize(text_, font, scale, thickness, &baseline);

  // Red panel across the top, text in white
  const int panel_h = std::min(img.rows, ts.height + baseline + 2 * margin);
  cv::rectangle(img, cv::Rect(0, 0, img.cols, panel_h), cv::Scalar(40, 40, 200, 255), cv::FILLED);
  cv::putText(img, text_, cv::Point(margin, margin + ts.height), font, scale,
              cv::Scalar(255, 255, 255, 255), thickness, cv::LINE_AA);
}

} // namespace toon
