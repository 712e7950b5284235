#pragma once

#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "core/config.hpp"

/*
    Stylizer maps one raw frame to one cartoon frame (posterized color + black outlines).
    Implementations are picked once at startup by MakeStylizer; the scheduler calls stylize()
    once per tick and never from two places at once.

    stylize() must fail soft: when processing is impossible it returns the source frame unchanged.
*/

namespace toon {

class Stylizer {
public:
  virtual ~Stylizer() = default;

  Stylizer(const Stylizer&) = delete;
  Stylizer& operator=(const Stylizer&) = delete;

  virtual const char* name() const = 0;

  // False when a required graphics capability is missing. Callers must not start a loop on it
  virtual bool ready() const { return true; }
  virtual std::string status() const { return "ok"; }

  virtual cv::Mat stylize(const cv::Mat& frame) = 0;

protected:
  Stylizer() = default;
};

// Builds the backend named by cfg.backend
std::unique_ptr<Stylizer> MakeStylizer(const StylizeConfig& cfg);

} // namespace toon
