#include <catch2/catch.hpp>

#include <cstdlib>

#include <opencv2/core.hpp>

#include "stylize/gl_stylizer.hpp"

using toon::GlStylizer;
using toon::GpuStyleConfig;

// Output bytes are within one step of the expected value after the GL float round trip
static bool Near(uchar got, int expected) {
  return std::abs(static_cast<int>(got) - expected) <= 1;
}

TEST_CASE("GPU stylizer without a graphics context fails soft", "[gpu]") {
  GlStylizer stylizer(GpuStyleConfig{});
  if (stylizer.ready()) {
    SUCCEED("OpenGL 3.3 context available");
    return;
  }

  REQUIRE(stylizer.status() != "ok");
  REQUIRE_FALSE(stylizer.status().empty());

  const cv::Mat frame(4, 4, CV_8UC4, cv::Scalar(200, 200, 200, 255));
  const cv::Mat out = stylizer.stylize(frame);
  REQUIRE(out.data == frame.data);
}

TEST_CASE("GPU stylizer posterizes to four levels", "[gpu]") {
  GlStylizer stylizer(GpuStyleConfig{});
  if (!stylizer.ready()) {
    WARN("skipped, no OpenGL 3.3 context: " << stylizer.status());
    return;
  }

  // 200 / 255 * 4 floors to 3, so every channel lands on 0.75
  const cv::Mat frame(6, 6, CV_8UC4, cv::Scalar(200, 200, 200, 255));
  const cv::Mat out = stylizer.stylize(frame);

  REQUIRE(out.size() == frame.size());
  REQUIRE(out.type() == CV_8UC4);
  for (int y = 0; y < out.rows; ++y) {
    for (int x = 0; x < out.cols; ++x) {
      const cv::Vec4b px = out.at<cv::Vec4b>(y, x);
      REQUIRE(Near(px[0], 191));
      REQUIRE(Near(px[1], 191));
      REQUIRE(Near(px[2], 191));
      REQUIRE(px[3] == 255);
    }
  }
  REQUIRE(stylizer.plane_scale().x == Approx(1.0f));
  REQUIRE(stylizer.plane_scale().y == Approx(1.0f));
}

TEST_CASE("GPU stylizer letterboxes into a fixed output size", "[gpu]") {
  GpuStyleConfig cfg;
  cfg.output_width = 8;
  cfg.output_height = 8;
  GlStylizer stylizer(cfg);
  if (!stylizer.ready()) {
    WARN("skipped, no OpenGL 3.3 context: " << stylizer.status());
    return;
  }

  const cv::Mat frame(4, 8, CV_8UC4, cv::Scalar(255, 255, 255, 255));
  const cv::Mat out = stylizer.stylize(frame);

  REQUIRE(out.size() == cv::Size(8, 8));
  REQUIRE(stylizer.plane_scale().x == Approx(1.0f));
  REQUIRE(stylizer.plane_scale().y == Approx(0.5f));

  // Rows 2..5 hold the frame, the rest are opaque black bars
  for (int x = 0; x < 8; ++x) {
    REQUIRE(out.at<cv::Vec4b>(0, x) == cv::Vec4b(0, 0, 0, 255));
    REQUIRE(out.at<cv::Vec4b>(7, x) == cv::Vec4b(0, 0, 0, 255));
    REQUIRE(out.at<cv::Vec4b>(3, x) == cv::Vec4b(255, 255, 255, 255));
  }
}
