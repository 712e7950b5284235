#pragma once

#include <opencv2/core.hpp>

#include "core/style_params.hpp"
#include "stylize/stylizer.hpp"

namespace toon {

// 256-entry CV_8U table mapping v to round(v / step) * step, step = 255 / (levels - 1).
// Throws std::invalid_argument for levels < 2
cv::Mat MakePosterizeLut(int levels);

// Applies lut to the B, G, R channels of a CV_8UC4 image in place, alpha untouched
void PosterizeInPlace(cv::Mat& bgra, const cv::Mat& lut);

// CV_32F luminance, Y = 0.299R + 0.587G + 0.114B
cv::Mat Luminance(const cv::Mat& bgra);

// CV_8U mask, 255 where the 3x3 Sobel magnitude of luminance exceeds threshold.
// The outer 1-pixel border is always 0
cv::Mat EdgeMask(const cv::Mat& bgra, float threshold);

// Posterize + outline at the input's own size. Input must be CV_8UC4
cv::Mat CartoonifyCpu(const cv::Mat& bgra, const StylizationParameters& params);

/*
    CPU pixel-buffer stylizer. Downsizes each frame into a reused processing-resolution
    scratch buffer, then runs CartoonifyCpu on it. The output stays at processing resolution;
    the presentation surface magnifies it with nearest-neighbor sampling.
*/
class CpuStylizer final : public Stylizer {
public:
  explicit CpuStylizer(StylizationParameters params = kCpuStyle);

  const char* name() const override { return "cpu"; }
  cv::Mat stylize(const cv::Mat& frame) override;

  cv::Size processing_size() const { return processing_size_; }
  const StylizationParameters& params() const { return params_; }

private:
  StylizationParameters params_;
  cv::Mat lut_;
  cv::Size native_size_{};
  cv::Size processing_size_{};
  cv::Mat scratch_;
};

} // namespace toon
