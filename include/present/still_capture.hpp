#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"

namespace toon {

// Wall-clock milliseconds since the Unix epoch, used in capture file names
std::uint64_t EpochMs();

// "<prefix>-<epoch_ms><extension>"
std::string CaptureFileName(const std::string& prefix, std::uint64_t epoch_ms, const std::string& extension);

// Lossless PNG bytes of img. Throws std::runtime_error if encoding fails
std::vector<unsigned char> EncodePng(const cv::Mat& img);

// Writes img as PNG into cfg.output_dir and returns the path. Throws std::runtime_error on failure
std::string SaveStill(const cv::Mat& img, const CaptureConfig& cfg);

} // namespace toon
