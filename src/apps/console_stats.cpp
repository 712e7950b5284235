#include "apps/console_stats.hpp"

#include <algorithm>
#include <iomanip>
#include <string>

namespace toon {

static constexpr const char* kReset = "\033[0m";
static constexpr const char* kRed   = "\033[31m";
static constexpr const char* kGreen = "\033[32m";
static constexpr const char* kYellow= "\033[33m";

static double NsToMs(std::uint64_t ns) { return static_cast<double>(ns) / 1e6; }

ConsoleStats::ConsoleStats(const Metrics& metrics, std::chrono::milliseconds interval, std::ostream& out)
    : metrics_(metrics), interval_(interval), out_(out) {}

bool ConsoleStats::maybe_print(SteadyClock::time_point now) {
  using namespace std::chrono;

  // First call only sets the baseline
  if (last_.time_since_epoch().count() == 0) {
    last_ = now;
    for (const auto& up : metrics_.stages()) {
      auto& p = prev_stage_[up.get()];
      p.count = up->count.load(std::memory_order_relaxed);
      p.work_ns = up->work_ns_total.load(std::memory_order_relaxed);
    }
    return false;
  }
  if (now - last_ < interval_) return false;

  const double dt = duration_cast<duration<double>>(now - last_).count();
  last_ = now;
  print(dt);
  return true;
}

// Busy% is the share of wall time a stage spent working since the previous table
void ConsoleStats::print(double dt) {
  const auto now_ns = NowNs();

  out_ << std::left
       << std::setw(12) << "STAGE"
       << std::setw(10) << "FPS"
       << std::setw(10) << "BUSY%"
       << std::setw(10) << "LAT(ms)"
       << std::setw(10) << "LAST(ms)"
       << std::setw(8) << "SKIP"
       << std::setw(8) << "FAIL"
       << "\n";
  out_ << std::string(12 + 10 + 10 + 10 + 10 + 8 + 8, '-') << "\n";

  for (const auto& up : metrics_.stages()) {
    const StageMetrics& m = *up;
    auto& p = prev_stage_[up.get()];

    const auto c = m.count.load(std::memory_order_relaxed);
    const double fps = (dt > 0) ? (static_cast<double>(c - p.count) / dt) : 0.0;
    p.count = c;

    const auto work = m.work_ns_total.load(std::memory_order_relaxed);
    double busy = (dt > 0) ? static_cast<double>(work - p.work_ns) / (dt * 1e9) : 0.0;
    busy = std::max(0.0, std::min(1.0, busy));
    const char* busy_color = (busy > 0.85) ? kRed : (busy > 0.60) ? kYellow : kGreen;
    p.work_ns = work;

    const double lat_ms = NsToMs(m.avg_latency_ns.load(std::memory_order_relaxed));
    const auto le = m.last_event_ns.load(std::memory_order_relaxed);
    const double last_ms = (le == 0 || le > now_ns) ? 0.0 : NsToMs(now_ns - le);

    out_ << std::left
         << std::setw(12) << m.name
         << std::setw(10) << std::fixed << std::setprecision(1) << fps
         << busy_color << std::setw(10) << std::fixed << std::setprecision(1) << (busy * 100.0) << kReset
         << std::setw(10) << std::fixed << std::setprecision(1) << lat_ms
         << std::setw(10) << std::fixed << std::setprecision(1) << last_ms
         << std::setw(8) << m.skipped.load(std::memory_order_relaxed)
         << std::setw(8) << m.failures.load(std::memory_order_relaxed)
         << "\n";
  }
  out_ << std::flush;
}

} // namespace toon
