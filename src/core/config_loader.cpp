#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

namespace toon {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>(); // Wrong types are reported, not defaulted
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static Backend ParseBackendKey(const YAML::Node& parent, const char* key, const std::string& key_path, Backend fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "cpu") return Backend::Cpu;
  if (s == "gpu") return Backend::Gpu;
  throw ConfigError(key_path, "unknown backend '" + s + "'. Use: cpu | gpu");
}

static void LoadCamera(const YAML::Node& root, CameraConfig& cfg) {
  const YAML::Node cam = root["camera"];
  if (!cam) return;
  const std::string p = "camera";

  cfg.device_index = GetOrKey<int>(cam, "device_index", PathJoin(p, "device_index"), cfg.device_index);
  cfg.source = GetOrKey<std::string>(cam, "source", PathJoin(p, "source"), cfg.source);
  cfg.width = GetOrKey<int>(cam, "width", PathJoin(p, "width"), cfg.width);
  cfg.height = GetOrKey<int>(cam, "height", PathJoin(p, "height"), cfg.height);
  cfg.fps = GetOrKey<int>(cam, "fps", PathJoin(p, "fps"), cfg.fps);
  cfg.flip_vertical = GetOrKey<bool>(cam, "flip_vertical", PathJoin(p, "flip_vertical"), cfg.flip_vertical);
  cfg.flip_horizontal = GetOrKey<bool>(cam, "flip_horizontal", PathJoin(p, "flip_horizontal"), cfg.flip_horizontal);
}

static void LoadStylize(const YAML::Node& root, StylizeConfig& cfg) {
  const YAML::Node sty = root["stylize"];
  if (!sty) return;
  const std::string p = "stylize";

  cfg.backend = ParseBackendKey(sty, "backend", PathJoin(p, "backend"), cfg.backend);

  const YAML::Node cpu = sty["cpu"];
  const std::string cp = PathJoin(p, "cpu");
  if (cpu) {
    cfg.cpu.levels = GetOrKey<int>(cpu, "levels", PathJoin(cp, "levels"), cfg.cpu.levels);
    cfg.cpu.edge_threshold = GetOrKey<float>(cpu, "edge_threshold", PathJoin(cp, "edge_threshold"), cfg.cpu.edge_threshold);
    cfg.cpu.scale_factor = GetOrKey<float>(cpu, "scale_factor", PathJoin(cp, "scale_factor"), cfg.cpu.scale_factor);
  }

  const YAML::Node gpu = sty["gpu"];
  const std::string gp = PathJoin(p, "gpu");
  if (gpu) {
    cfg.gpu.levels = GetOrKey<int>(gpu, "levels", PathJoin(gp, "levels"), cfg.gpu.levels);
    cfg.gpu.edge_threshold = GetOrKey<float>(gpu, "edge_threshold", PathJoin(gp, "edge_threshold"), cfg.gpu.edge_threshold);
    cfg.gpu.output_width = GetOrKey<int>(gpu, "output_width", PathJoin(gp, "output_width"), cfg.gpu.output_width);
    cfg.gpu.output_height = GetOrKey<int>(gpu, "output_height", PathJoin(gp, "output_height"), cfg.gpu.output_height);
  }
}

static void LoadPresentation(const YAML::Node& root, PresentationConfig& cfg) {
  const YAML::Node pres = root["presentation"];
  if (!pres) return;
  const std::string p = "presentation";

  cfg.window_name = GetOrKey<std::string>(pres, "window_name", PathJoin(p, "window_name"), cfg.window_name);
  cfg.width = GetOrKey<int>(pres, "width", PathJoin(p, "width"), cfg.width);
  cfg.height = GetOrKey<int>(pres, "height", PathJoin(p, "height"), cfg.height);
  cfg.refresh_hz = GetOrKey<int>(pres, "refresh_hz", PathJoin(p, "refresh_hz"), cfg.refresh_hz);
  cfg.notice_ms = GetOrKey<int>(pres, "notice_ms", PathJoin(p, "notice_ms"), cfg.notice_ms);
}

static void LoadCapture(const YAML::Node& root, CaptureConfig& cfg) {
  const YAML::Node cap = root["capture"];
  if (!cap) return;
  const std::string p = "capture";

  cfg.output_dir = GetOrKey<std::string>(cap, "output_dir", PathJoin(p, "output_dir"), cfg.output_dir);
  cfg.prefix = GetOrKey<std::string>(cap, "prefix", PathJoin(p, "prefix"), cfg.prefix);
}

static void LoadRecording(const YAML::Node& root, RecordingConfig& cfg) {
  const YAML::Node rec = root["recording"];
  if (!rec) return;
  const std::string p = "recording";

  cfg.fps = GetOrKey<int>(rec, "fps", PathJoin(p, "fps"), cfg.fps);
  cfg.fourcc = GetOrKey<std::string>(rec, "fourcc", PathJoin(p, "fourcc"), cfg.fourcc);
  cfg.extension = GetOrKey<std::string>(rec, "extension", PathJoin(p, "extension"), cfg.extension);
}

static void LoadMetrics(const YAML::Node& root, MetricsConfig& cfg) {
  const YAML::Node m = root["metrics"];
  if (!m) return;
  const std::string p = "metrics";

  cfg.enable_console_log = GetOrKey<bool>(m, "enable_console_log", PathJoin(p, "enable_console_log"), cfg.enable_console_log);
  cfg.log_interval_ms = GetOrKey<int>(m, "log_interval_ms", PathJoin(p, "log_interval_ms"), cfg.log_interval_ms);
}

StylizationParameters ToParameters(const CpuStyleConfig& cfg) {
  return StylizationParameters{cfg.levels, cfg.edge_threshold, cfg.scale_factor};
}

StylizationParameters ToParameters(const GpuStyleConfig& cfg) {
  return StylizationParameters{cfg.levels, cfg.edge_threshold, 1.0f};
}

void ValidateOrThrow(const AppConfig& cfg) {
  if (cfg.camera.width <= 0 || cfg.camera.height <= 0) throw ConfigError("camera", "width/height must be > 0");
  if (cfg.camera.fps <= 0) throw ConfigError("camera.fps", "must be > 0");

  const auto& cpu = cfg.stylize.cpu;
  if (cpu.levels < 2) throw ConfigError("stylize.cpu.levels", "must be >= 2");
  if (cpu.edge_threshold < 0.f) throw ConfigError("stylize.cpu.edge_threshold", "must be >= 0");
  if (!(cpu.scale_factor > 0.f && cpu.scale_factor <= 1.f))
    throw ConfigError("stylize.cpu.scale_factor", "must be in (0, 1]");

  const auto& gpu = cfg.stylize.gpu;
  if (gpu.levels < 1) throw ConfigError("stylize.gpu.levels", "must be >= 1");
  if (gpu.edge_threshold < 0.f) throw ConfigError("stylize.gpu.edge_threshold", "must be >= 0");
  if (gpu.output_width < 0 || gpu.output_height < 0)
    throw ConfigError("stylize.gpu", "output_width/output_height must be >= 0");
  if ((gpu.output_width == 0) != (gpu.output_height == 0))
    throw ConfigError("stylize.gpu", "output_width/output_height must both be set or both be 0");

  const auto& pres = cfg.presentation;
  if (pres.width < 0 || pres.height < 0) throw ConfigError("presentation", "width/height must be >= 0");
  if ((pres.width == 0) != (pres.height == 0))
    throw ConfigError("presentation", "width/height must both be set or both be 0");
  if (pres.refresh_hz < 0) throw ConfigError("presentation.refresh_hz", "must be >= 0");
  if (pres.notice_ms <= 0) throw ConfigError("presentation.notice_ms", "must be > 0");

  if (cfg.capture.prefix.empty()) throw ConfigError("capture.prefix", "must not be empty");

  if (cfg.recording.fps <= 0) throw ConfigError("recording.fps", "must be > 0");
  if (cfg.recording.fourcc.size() != 4) throw ConfigError("recording.fourcc", "must be exactly 4 characters");

  if (cfg.metrics.log_interval_ms <= 0) throw ConfigError("metrics.log_interval_ms", "must be > 0");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  LoadCamera(root, cfg.camera);
  LoadStylize(root, cfg.stylize);
  LoadPresentation(root, cfg.presentation);
  LoadCapture(root, cfg.capture);
  LoadRecording(root, cfg.recording);
  LoadMetrics(root, cfg.metrics);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& text) {
  YAML::Node root;

  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace toon
