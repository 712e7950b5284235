#pragma once

#include <opencv2/core.hpp>

/*
    Size math shared by the stylizers and the presentation surfaces:
    - processing resolution for the CPU path (native size times a downscale factor)
    - letterbox plane scale that keeps the source aspect ratio inside a differently shaped surface
*/

namespace toon {

// Per-axis scale applied to a full-surface plane, each in (0, 1]
struct PlaneScale {
  float x{1.f};
  float y{1.f};
};

// floor(native * scale_factor) per axis, never below 1. Throws std::invalid_argument
// when scale_factor is outside (0, 1] or native is empty
cv::Size ComputeProcessingResolution(cv::Size native, float scale_factor);

// Shrinks x when the surface is wider than the frame, y otherwise
PlaneScale ComputeLetterbox(cv::Size frame, cv::Size surface);

// Pixel rect of a scaled plane centered in the surface
cv::Rect LetterboxRect(cv::Size surface, PlaneScale scale);

} // namespace toon
