#pragma once

/*
    Fixed stylization constants for one run. The CPU and GPU paths are two separate
    realizations of the same look and do not share values. The CPU threshold applies to
    gradients of 8-bit luminance, the GPU one to gradients of normalized luminance.
*/

namespace toon {

struct StylizationParameters {
  int levels;            // Quantization level count
  float edge_threshold;  // Sobel magnitude above which a pixel becomes an outline
  float scale_factor;    // CPU only, processing downscale in (0, 1]
};

inline constexpr StylizationParameters kCpuStyle{7, 80.0f, 0.5f};
inline constexpr StylizationParameters kGpuStyle{4, 0.4f, 1.0f};

} // namespace toon
