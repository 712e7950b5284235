#pragma once

#include <chrono>
#include <string>

#include "apps/notice_overlay.hpp"
#include "present/surface.hpp"

namespace toon {

// CanvasSurface shown in a HighGUI window. Notices are drawn on the displayed copy only,
// never into the canvas, so snapshots and recordings stay clean
class WindowSurface final : public CanvasSurface {
public:
  WindowSurface(std::string window_name, cv::Size fixed_size, std::chrono::milliseconds notice_lifetime);
  ~WindowSurface() override;

  WindowSurface(const WindowSurface&) = delete;
  WindowSurface& operator=(const WindowSurface&) = delete;

  void present(const cv::Mat& frame) override;

  // Redraws the last canvas (or a placeholder while idle) with any active notice
  void refresh();

  void show_notice(const std::string& text);

  const std::string& window_name() const { return window_name_; }

private:
  std::string window_name_;
  NoticeOverlay notice_;
  cv::Mat display_;
};

} // namespace toon
