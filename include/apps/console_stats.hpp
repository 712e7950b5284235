#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <unordered_map>

#include "infra/metrics.hpp"

namespace toon {

// Periodic per-stage table on the console: FPS, BUSY%, LAT(ms), LAST(ms), SKIP and FAIL counts.
// Driven from the main loop, prints at most once per interval
class ConsoleStats {
public:
  ConsoleStats(const Metrics& metrics, std::chrono::milliseconds interval, std::ostream& out);

  // Returns true if a table was printed
  bool maybe_print(SteadyClock::time_point now = SteadyClock::now());

private:
  void print(double dt);

  const Metrics& metrics_;
  std::chrono::milliseconds interval_;
  std::ostream& out_;
  SteadyClock::time_point last_{};

  struct Prev { std::uint64_t count{0}; std::uint64_t work_ns{0}; };
  std::unordered_map<const StageMetrics*, Prev> prev_stage_;
};

} // namespace toon
