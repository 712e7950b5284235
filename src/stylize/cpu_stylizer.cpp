#include "stylize/cpu_stylizer.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

#include "core/geometry.hpp"

namespace toon {

cv::Mat MakePosterizeLut(int levels) {
  if (levels < 2) throw std::invalid_argument("posterize levels must be >= 2");

  const double step = 255.0 / static_cast<double>(levels - 1);
  cv::Mat lut(1, 256, CV_8U);
  for (int v = 0; v < 256; ++v) {
    // Half-up rounding of the bin index, then a nearest-even store to 8 bits
    const double bin = std::floor(static_cast<double>(v) / step + 0.5);
    lut.at<uchar>(v) = cv::saturate_cast<uchar>(bin * step);
  }
  return lut;
}

void PosterizeInPlace(cv::Mat& bgra, const cv::Mat& lut) {
  CV_Assert(bgra.type() == CV_8UC4);
  CV_Assert(lut.type() == CV_8U && lut.total() == 256);

  const uchar* table = lut.ptr<uchar>();
  for (int y = 0; y < bgra.rows; ++y) {
    cv::Vec4b* row = bgra.ptr<cv::Vec4b>(y);
    for (int x = 0; x < bgra.cols; ++x) {
      row[x][0] = table[row[x][0]];
      row[x][1] = table[row[x][1]];
      row[x][2] = table[row[x][2]];
    }
  }
}

cv::Mat Luminance(const cv::Mat& bgra) {
  CV_Assert(bgra.type() == CV_8UC4);

  cv::Mat as_float;
  bgra.convertTo(as_float, CV_32FC4);

  // Channel order is B, G, R, A
  cv::Mat lum;
  cv::transform(as_float, lum, cv::Matx14f(0.114f, 0.587f, 0.299f, 0.f));
  return lum;
}

cv::Mat EdgeMask(const cv::Mat& bgra, float threshold) {
  cv::Mat mask = cv::Mat::zeros(bgra.size(), CV_8U);
  if (bgra.rows < 3 || bgra.cols < 3) return mask; // No interior pixels

  const cv::Mat lum = Luminance(bgra);

  cv::Mat gx, gy, mag;
  cv::Sobel(lum, gx, CV_32F, 1, 0, 3);
  cv::Sobel(lum, gy, CV_32F, 0, 1, 3);
  cv::magnitude(gx, gy, mag);

  // Only the interior is classified, border stays 0
  const cv::Rect interior(1, 1, bgra.cols - 2, bgra.rows - 2);
  cv::Mat inner = mask(interior);
  cv::compare(mag(interior), static_cast<double>(threshold), inner, cv::CMP_GT);
  return mask;
}

static cv::Mat Cartoonify(const cv::Mat& bgra, const cv::Mat& lut, float threshold) {
  CV_Assert(bgra.type() == CV_8UC4);

  // Edges come from the original colors, so compute them before posterizing
  const cv::Mat edges = EdgeMask(bgra, threshold);

  cv::Mat out = bgra.clone();
  PosterizeInPlace(out, lut);

  for (int y = 0; y < out.rows; ++y) {
    const uchar* m = edges.ptr<uchar>(y);
    cv::Vec4b* row = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < out.cols; ++x) {
      if (m[x] == 0) continue;
      row[x][0] = 0;
      row[x][1] = 0;
      row[x][2] = 0;
    }
  }
  return out;
}

cv::Mat CartoonifyCpu(const cv::Mat& bgra, const StylizationParameters& params) {
  return Cartoonify(bgra, MakePosterizeLut(params.levels), params.edge_threshold);
}

CpuStylizer::CpuStylizer(StylizationParameters params)
    : params_(params), lut_(MakePosterizeLut(params.levels)) {
  if (!(params_.scale_factor > 0.f && params_.scale_factor <= 1.f)) {
    throw std::invalid_argument("cpu scale_factor must be in (0, 1]");
  }
}

cv::Mat CpuStylizer::stylize(const cv::Mat& frame) {
  if (frame.empty()) return frame;

  try {
    cv::Mat src = frame;
    if (src.type() == CV_8UC3) cv::cvtColor(frame, src, cv::COLOR_BGR2BGRA);

    // Recompute before the scratch buffer is touched so a device switch never reads stale sizes
    if (src.size() != native_size_) {
      native_size_ = src.size();
      processing_size_ = ComputeProcessingResolution(native_size_, params_.scale_factor);
      std::cout << "cpu_stylizer processing " << native_size_.width << "x" << native_size_.height
                << " at " << processing_size_.width << "x" << processing_size_.height << std::endl;
    }

    cv::resize(src, scratch_, processing_size_, 0, 0, cv::INTER_AREA);
    return Cartoonify(scratch_, lut_, params_.edge_threshold);
  } catch (const cv::Exception& e) {
    std::cerr << "cpu_stylizer: processing failed, presenting raw frame: " << e.what() << "\n";
    return frame;
  }
}

} // namespace toon
