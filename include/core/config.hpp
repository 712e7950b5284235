#pragma once
#include <string>

#include "core/style_params.hpp"

namespace toon {

enum class Backend {
  Cpu,
  Gpu
};

struct CameraConfig {
  int device_index = 0;
  std::string source = ""; // Optional video file path, used instead of device_index when set

  int width = 1280;
  int height = 720;
  int fps = 30;

  bool flip_vertical = false;
  bool flip_horizontal = false;
};

struct CpuStyleConfig {
  int levels = kCpuStyle.levels;
  float edge_threshold = kCpuStyle.edge_threshold;
  float scale_factor = kCpuStyle.scale_factor;
};

struct GpuStyleConfig {
  int levels = kGpuStyle.levels;
  float edge_threshold = kGpuStyle.edge_threshold;

  // Render target size, 0 = same as the source frame
  int output_width = 0;
  int output_height = 0;
};

struct StylizeConfig {
  Backend backend = Backend::Cpu;
  CpuStyleConfig cpu{};
  GpuStyleConfig gpu{};
};

struct PresentationConfig {
  std::string window_name = "ToonyCam";

  // Surface size, 0 = follow the source resolution
  int width = 0;
  int height = 0;

  int refresh_hz = 60; // 0 = unpaced
  int notice_ms = 3000;
};

struct CaptureConfig {
  std::string output_dir = ".";
  std::string prefix = "toonycam";
};

struct RecordingConfig {
  int fps = 30;
  std::string fourcc = "MJPG";
  std::string extension = ".avi";
};

struct MetricsConfig {
  bool enable_console_log = true;
  int log_interval_ms = 1000;
};

struct AppConfig {
  CameraConfig camera{};
  StylizeConfig stylize{};
  PresentationConfig presentation{};
  CaptureConfig capture{};
  RecordingConfig recording{};
  MetricsConfig metrics{};
};

StylizationParameters ToParameters(const CpuStyleConfig& cfg);
StylizationParameters ToParameters(const GpuStyleConfig& cfg);

}
