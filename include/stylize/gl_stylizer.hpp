#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/geometry.hpp"
#include "stylize/stylizer.hpp"

struct GLFWwindow;

namespace toon {

/*
    GPU stylizer. Owns a hidden GLFW window for its OpenGL 3.3 core context, one shader program,
    the frame texture, a fullscreen quad and an offscreen render target. Each frame is uploaded,
    drawn through the cartoon fragment shader into the render target and read back.

    The render target is the configured output size (or the frame size when unset). The quad is
    letterboxed into it so the frame's aspect ratio is kept; the bars stay black.

    All GL objects and the context are released in the destructor.
*/
class GlStylizer final : public Stylizer {
public:
  explicit GlStylizer(GpuStyleConfig cfg);
  ~GlStylizer() override;

  const char* name() const override { return "gpu"; }
  bool ready() const override { return ready_; }
  std::string status() const override { return status_; }

  cv::Mat stylize(const cv::Mat& frame) override;

  PlaneScale plane_scale() const { return plane_scale_; }

private:
  bool init_context();
  bool build_program();
  void create_quad();
  void ensure_texture(cv::Size frame);
  void ensure_target(cv::Size target);
  void release();
  void fail(const std::string& msg);

  GpuStyleConfig cfg_;
  bool ready_{false};
  std::string status_{"not initialized"};

  GLFWwindow* window_{nullptr};
  unsigned int program_{0};
  unsigned int vao_{0};
  unsigned int vbo_{0};
  unsigned int texture_{0};
  unsigned int fbo_{0};
  unsigned int color_rb_{0};

  int loc_resolution_{-1};
  int loc_levels_{-1};
  int loc_threshold_{-1};
  int loc_plane_scale_{-1};
  int loc_frame_{-1};

  cv::Size texture_size_{};
  cv::Size target_size_{};
  PlaneScale plane_scale_{};
};

} // namespace toon
