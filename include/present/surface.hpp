#pragma once

#include <opencv2/core.hpp>

#include "core/geometry.hpp"

namespace toon {

// Output side of the pipeline. Written only by the scheduler's current tick
class PresentationSurface {
public:
  virtual ~PresentationSurface() = default;

  virtual bool valid() const = 0;

  // Called before the first pass and whenever the source's native size changes
  virtual void on_source_resized(cv::Size native) = 0;

  // Draws a stylized (or raw fallback) frame onto the surface
  virtual void present(const cv::Mat& frame) = 0;

  // Current surface contents, BGRA
  virtual const cv::Mat& canvas() const = 0;

  cv::Mat snapshot() const { return canvas().clone(); }
};

/*
    In-memory surface. Its size follows the source's native resolution unless a fixed size is
    given. Frames are magnified with nearest-neighbor sampling only, and letterboxed by their own
    aspect ratio when it differs from the surface shape; bars are opaque black.
*/
class CanvasSurface : public PresentationSurface {
public:
  explicit CanvasSurface(cv::Size fixed_size = cv::Size());

  bool valid() const override { return !canvas_.empty(); }
  void on_source_resized(cv::Size native) override;
  void present(const cv::Mat& frame) override;
  const cv::Mat& canvas() const override { return canvas_; }

  // Forgets the source size; invalid until the next on_source_resized
  void reset();

  cv::Size size() const { return canvas_.size(); }
  cv::Size source_size() const { return source_size_; }
  PlaneScale plane_scale() const { return plane_scale_; }
  cv::Rect plane_rect() const { return plane_rect_; }

private:
  cv::Size fixed_size_;
  cv::Size source_size_{};
  cv::Size presented_size_{}; // Frame size the current plane was fitted to
  PlaneScale plane_scale_{};
  cv::Rect plane_rect_{};
  cv::Mat canvas_;
};

} // namespace toon
