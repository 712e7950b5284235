#include "core/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace toon {

cv::Size ComputeProcessingResolution(cv::Size native, float scale_factor) {
  if (!(scale_factor > 0.f && scale_factor <= 1.f)) {
    throw std::invalid_argument("scale_factor must be in (0, 1]");
  }
  if (native.width <= 0 || native.height <= 0) {
    throw std::invalid_argument("native resolution must be non-empty");
  }

  const int w = static_cast<int>(std::floor(native.width * static_cast<double>(scale_factor)));
  const int h = static_cast<int>(std::floor(native.height * static_cast<double>(scale_factor)));
  return cv::Size(std::max(1, w), std::max(1, h));
}

PlaneScale ComputeLetterbox(cv::Size frame, cv::Size surface) {
  PlaneScale s;
  if (frame.width <= 0 || frame.height <= 0 || surface.width <= 0 || surface.height <= 0) return s;

  const float video_aspect = static_cast<float>(frame.width) / static_cast<float>(frame.height);
  const float surface_aspect = static_cast<float>(surface.width) / static_cast<float>(surface.height);

  if (surface_aspect > video_aspect) {
    s.x = video_aspect / surface_aspect; // Bars left/right
  } else {
    s.y = surface_aspect / video_aspect; // Bars top/bottom
  }
  return s;
}

cv::Rect LetterboxRect(cv::Size surface, PlaneScale scale) {
  const int w = std::max(1, static_cast<int>(std::lround(surface.width * scale.x)));
  const int h = std::max(1, static_cast<int>(std::lround(surface.height * scale.y)));
  const int x = (surface.width - w) / 2;
  const int y = (surface.height - h) / 2;
  return cv::Rect(x, y, std::min(w, surface.width), std::min(h, surface.height));
}

} // namespace toon
