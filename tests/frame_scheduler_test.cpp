#include <catch2/catch.hpp>

#include <opencv2/core.hpp>

#include "infra/metrics.hpp"
#include "pipeline/frame_scheduler.hpp"
#include "present/surface.hpp"

#include "mocks/counting_stylizer.hpp"
#include "mocks/manual_refresh_driver.hpp"
#include "mocks/scripted_frame_source.hpp"

using toon::FrameScheduler;
using toon::SchedulerState;

namespace {

struct Rig {
  mocks::ScriptedFrameSource source;
  mocks::CountingStylizer stylizer;
  toon::CanvasSurface surface;
  mocks::ManualRefreshDriver driver;
  toon::StageMetrics metrics{"stylize"};
  FrameScheduler scheduler{source, stylizer, surface, driver, &metrics};
};

} // namespace

TEST_CASE("Scheduler start and stop", "[scheduler]") {
  Rig rig;

  SECTION("idle until started") {
    REQUIRE(rig.scheduler.state() == SchedulerState::Idle);
    REQUIRE(rig.driver.pending() == 0);
  }

  SECTION("start requests exactly one tick") {
    rig.scheduler.start();
    REQUIRE(rig.scheduler.running());
    REQUIRE(rig.scheduler.has_pending_tick());
    REQUIRE(rig.driver.pending() == 1);

    rig.scheduler.start(); // Already running
    REQUIRE(rig.driver.pending() == 1);
  }

  SECTION("stop cancels the pending tick") {
    rig.scheduler.start();
    rig.scheduler.stop();
    REQUIRE(rig.scheduler.state() == SchedulerState::Idle);
    REQUIRE_FALSE(rig.scheduler.has_pending_tick());
    REQUIRE(rig.driver.pending() == 0);
    REQUIRE(rig.driver.cancelled() == 1);
    REQUIRE(rig.stylizer.calls() == 0);
  }

  SECTION("stop while idle does nothing") {
    rig.scheduler.stop();
    REQUIRE(rig.driver.cancelled() == 0);
  }
}

TEST_CASE("Scheduler presents one stylized frame per tick", "[scheduler]") {
  Rig rig;
  rig.scheduler.start();

  REQUIRE(rig.driver.fire_n(3) == 3);

  const auto& st = rig.scheduler.stats();
  REQUIRE(st.ticks == 3);
  REQUIRE(st.presented == 3);
  REQUIRE(st.skipped == 0);
  REQUIRE(rig.stylizer.calls() == 3);
  REQUIRE(rig.metrics.count.load() == 3);

  // Source is 200 gray, the mock stylizer inverts it
  REQUIRE(rig.surface.valid());
  const cv::Vec4b px = rig.surface.canvas().at<cv::Vec4b>(2, 3);
  REQUIRE(px[0] == 55);
  REQUIRE(px[1] == 55);
  REQUIRE(px[2] == 55);
  REQUIRE(px[3] == 255);

  // Always re-armed, never more than one registration
  REQUIRE(rig.driver.pending() == 1);
}

TEST_CASE("Scheduler keeps ticking while the source is not ready", "[scheduler]") {
  Rig rig;
  rig.source.set_ready(false);
  rig.scheduler.start();

  REQUIRE(rig.driver.fire_n(10) == 10);
  REQUIRE(rig.scheduler.stats().skipped == 10);
  REQUIRE(rig.scheduler.stats().presented == 0);
  REQUIRE(rig.stylizer.calls() == 0);
  REQUIRE(rig.metrics.skipped.load() == 10);
  REQUIRE(rig.driver.pending() == 1);

  // Recovers on the next tick once frames arrive
  rig.source.set_ready(true);
  REQUIRE(rig.driver.fire());
  REQUIRE(rig.scheduler.stats().presented == 1);
}

TEST_CASE("Scheduler ignores ticks after stop", "[scheduler]") {
  Rig rig;
  rig.driver.set_ignore_cancel(true);
  rig.scheduler.start();
  REQUIRE(rig.driver.fire());
  rig.scheduler.stop();

  const auto ticks = rig.scheduler.stats().ticks;
  const int calls = rig.stylizer.calls();

  SECTION("a cancelled tick that fires anyway is a no-op") {
    REQUIRE(rig.driver.fire_stale() == 1);
    REQUIRE(rig.scheduler.stats().ticks == ticks);
    REQUIRE(rig.stylizer.calls() == calls);
    REQUIRE(rig.driver.pending() == 0);
  }

  SECTION("a stale tick does not disturb a restarted scheduler") {
    rig.scheduler.start();
    REQUIRE(rig.driver.pending() == 1);

    REQUIRE(rig.driver.fire_stale() == 1);
    REQUIRE(rig.scheduler.stats().ticks == ticks);
    REQUIRE(rig.scheduler.has_pending_tick());
    REQUIRE(rig.driver.pending() == 1);

    REQUIRE(rig.driver.fire());
    REQUIRE(rig.scheduler.stats().ticks == ticks + 1);
    REQUIRE(rig.driver.pending() == 1);
  }

  SECTION("direct tick while idle is a no-op") {
    rig.scheduler.tick();
    REQUIRE(rig.scheduler.stats().ticks == ticks);
  }
}

TEST_CASE("Scheduler stop from inside a presented hook", "[scheduler]") {
  Rig rig;
  rig.scheduler.set_on_presented([&rig](const cv::Mat&) { rig.scheduler.stop(); });
  rig.scheduler.start();

  REQUIRE(rig.driver.fire());
  REQUIRE(rig.scheduler.stats().presented == 1);
  REQUIRE_FALSE(rig.scheduler.running());
  REQUIRE(rig.driver.pending() == 0);
}

TEST_CASE("Scheduler follows source resolution changes", "[scheduler]") {
  Rig rig;
  rig.source.set_size(cv::Size(8, 6));
  rig.scheduler.start();

  REQUIRE(rig.driver.fire());
  REQUIRE(rig.surface.size() == cv::Size(8, 6));
  REQUIRE(rig.scheduler.stats().resizes == 1);

  REQUIRE(rig.driver.fire());
  REQUIRE(rig.scheduler.stats().resizes == 1);

  rig.source.set_size(cv::Size(16, 10));
  REQUIRE(rig.driver.fire());
  REQUIRE(rig.scheduler.stats().resizes == 2);
  REQUIRE(rig.surface.size() == cv::Size(16, 10));
  REQUIRE(rig.surface.source_size() == cv::Size(16, 10));
  REQUIRE(rig.stylizer.last_size() == cv::Size(16, 10));

  SECTION("restart re-sizes the surface even at the same resolution") {
    rig.scheduler.stop();
    rig.surface.reset();
    rig.scheduler.start();
    REQUIRE(rig.driver.fire());
    REQUIRE(rig.scheduler.stats().resizes == 3);
    REQUIRE(rig.surface.valid());
  }
}

TEST_CASE("Scheduler presents the raw frame when stylizing throws", "[scheduler]") {
  Rig rig;
  rig.stylizer.set_throw(true);
  rig.scheduler.start();

  REQUIRE(rig.driver.fire_n(2) == 2);

  const auto& st = rig.scheduler.stats();
  REQUIRE(st.failures == 2);
  REQUIRE(st.presented == 2);
  REQUIRE(rig.metrics.failures.load() == 2);

  const cv::Vec4b px = rig.surface.canvas().at<cv::Vec4b>(0, 0);
  REQUIRE(px[0] == 200);
  REQUIRE(px[2] == 200);

  // Loop survives and picks up once the stylizer works again
  REQUIRE(rig.driver.pending() == 1);
  rig.stylizer.set_throw(false);
  REQUIRE(rig.driver.fire());
  REQUIRE(rig.surface.canvas().at<cv::Vec4b>(0, 0)[0] == 55);
}

TEST_CASE("Scheduler hook receives every presented canvas", "[scheduler]") {
  Rig rig;
  int seen = 0;
  cv::Size last;
  rig.scheduler.set_on_presented([&](const cv::Mat& canvas) {
    ++seen;
    last = canvas.size();
  });
  rig.scheduler.start();
  rig.driver.fire_n(4);

  REQUIRE(seen == 4);
  REQUIRE(last == cv::Size(8, 6));
}

TEST_CASE("Scheduler destruction cancels the pending tick", "[scheduler]") {
  mocks::ScriptedFrameSource source;
  mocks::CountingStylizer stylizer;
  toon::CanvasSurface surface;
  mocks::ManualRefreshDriver driver;

  {
    FrameScheduler scheduler(source, stylizer, surface, driver);
    scheduler.start();
    REQUIRE(driver.pending() == 1);
  }
  REQUIRE(driver.pending() == 0);
  REQUIRE(driver.cancelled() == 1);
}
