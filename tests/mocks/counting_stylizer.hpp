#pragma once

#include <stdexcept>

#include <opencv2/core.hpp>

#include "stylize/stylizer.hpp"

namespace mocks {

// Stylizer that inverts B, G, R so tests can tell stylized output from the raw frame.
// Can be told to throw, to check the scheduler keeps presenting
class CountingStylizer : public toon::Stylizer {
public:
  const char* name() const override { return "counting"; }

  cv::Mat stylize(const cv::Mat& frame) override {
    ++calls_;
    last_size_ = frame.size();
    if (throw_) throw std::runtime_error("stylize failed on purpose");

    cv::Mat out = frame.clone();
    for (int y = 0; y < out.rows; ++y) {
      cv::Vec4b* row = out.ptr<cv::Vec4b>(y);
      for (int x = 0; x < out.cols; ++x) {
        row[x][0] = static_cast<uchar>(255 - row[x][0]);
        row[x][1] = static_cast<uchar>(255 - row[x][1]);
        row[x][2] = static_cast<uchar>(255 - row[x][2]);
      }
    }
    return out;
  }

  void set_throw(bool v) { throw_ = v; }

  int calls() const { return calls_; }
  cv::Size last_size() const { return last_size_; }

private:
  bool throw_{false};
  int calls_{0};
  cv::Size last_size_{};
};

} // namespace mocks
