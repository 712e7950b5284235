#pragma once

#include <chrono>
#include <string>

#include <opencv2/core.hpp>

namespace toon {

// Transient message banner. A notice shows until its deadline, then clears itself
class NoticeOverlay {
public:
  using Clock = std::chrono::steady_clock;

  explicit NoticeOverlay(std::chrono::milliseconds lifetime);

  void show(std::string text, Clock::time_point now = Clock::now());
  void clear();

  bool active(Clock::time_point now = Clock::now()) const;
  const std::string& text() const { return text_; }

  // Draws the banner into the top of img if a notice is active
  void draw(cv::Mat& img, Clock::time_point now = Clock::now()) const;

private:
  std::chrono::milliseconds lifetime_;
  std::string text_;
  Clock::time_point expires_{};
};

} // namespace toon
