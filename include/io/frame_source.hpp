#pragma once

#include "core/frame.hpp"

namespace toon {

// Supplies the current raw frame once per tick. Implementations report the actual
// frame size they deliver, which may differ from what was requested
class FrameSource {
public:
  virtual ~FrameSource() = default;

  // False while no frame can be delivered yet (camera warming up, stream stopped, end of file)
  virtual bool ready() const = 0;

  // Fills out with the current frame. Returns false if nothing is available this tick
  virtual bool read(Frame& out) = 0;
};

} // namespace toon
