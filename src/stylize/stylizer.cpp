#include "stylize/stylizer.hpp"

#include <iostream>

#include "stylize/cpu_stylizer.hpp"
#include "stylize/gl_stylizer.hpp"

namespace toon {

std::unique_ptr<Stylizer> MakeStylizer(const StylizeConfig& cfg) {
  std::unique_ptr<Stylizer> s;
  switch (cfg.backend) {
    case Backend::Gpu:
      s = std::make_unique<GlStylizer>(cfg.gpu);
      break;
    case Backend::Cpu:
      s = std::make_unique<CpuStylizer>(ToParameters(cfg.cpu));
      break;
  }

  std::cout << "Stylizer backend: " << s->name() << " (" << (s->ready() ? "ready" : "not ready") << ")" << std::endl;
  return s;
}

} // namespace toon
