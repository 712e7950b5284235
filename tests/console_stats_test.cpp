#include <catch2/catch.hpp>

#include <chrono>
#include <sstream>

#include "apps/console_stats.hpp"
#include "infra/metrics.hpp"

using namespace std::chrono_literals;

TEST_CASE("Console stats print once per interval", "[console_stats]") {
  toon::Metrics metrics;
  toon::StageMetrics* stylize = metrics.make_stage("stylize");
  std::ostringstream out;
  toon::ConsoleStats stats(metrics, 1000ms, out);

  const auto t0 = toon::SteadyClock::now();
  REQUIRE_FALSE(stats.maybe_print(t0)); // Baseline
  REQUIRE(out.str().empty());

  stylize->on_item(2'000'000);
  stylize->on_skip();
  REQUIRE_FALSE(stats.maybe_print(t0 + 500ms));
  REQUIRE(stats.maybe_print(t0 + 1000ms));

  const std::string table = out.str();
  REQUIRE_THAT(table, Catch::Contains("STAGE"));
  REQUIRE_THAT(table, Catch::Contains("stylize"));
  REQUIRE_THAT(table, Catch::Contains("2.0")); // Latency in ms

  REQUIRE_FALSE(stats.maybe_print(t0 + 1500ms));
}
