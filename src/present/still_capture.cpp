#include "present/still_capture.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>

namespace toon {

std::uint64_t EpochMs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

std::string CaptureFileName(const std::string& prefix, std::uint64_t epoch_ms, const std::string& extension) {
  return prefix + "-" + std::to_string(epoch_ms) + extension;
}

std::vector<unsigned char> EncodePng(const cv::Mat& img) {
  if (img.empty()) throw std::runtime_error("Cannot encode an empty image");

  std::vector<unsigned char> buf;
  if (!cv::imencode(".png", img, buf)) {
    throw std::runtime_error("PNG encoding failed");
  }
  return buf;
}

std::string SaveStill(const cv::Mat& img, const CaptureConfig& cfg) {
  const std::vector<unsigned char> png = EncodePng(img);

  std::filesystem::create_directories(cfg.output_dir);
  const std::filesystem::path path =
      std::filesystem::path(cfg.output_dir) / CaptureFileName(cfg.prefix, EpochMs(), ".png");

  std::ofstream out(path, std::ios::binary);
  if (!out) throw std::runtime_error("Could not open '" + path.string() + "' for writing");
  out.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
  if (!out) throw std::runtime_error("Failed writing '" + path.string() + "'");

  return path.string();
}

} // namespace toon
