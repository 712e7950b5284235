#include <catch2/catch.hpp>

#include <stdexcept>

#include <opencv2/core.hpp>

#include "stylize/cpu_stylizer.hpp"

using namespace toon;

static cv::Mat Solid(cv::Size size, uchar v) {
  return cv::Mat(size, CV_8UC4, cv::Scalar(v, v, v, 255));
}

TEST_CASE("Posterize table", "[cpu][posterize]") {
  const cv::Mat lut = MakePosterizeLut(7);
  REQUIRE(lut.total() == 256);

  SECTION("end points are kept") {
    REQUIRE(lut.at<uchar>(0) == 0);
    REQUIRE(lut.at<uchar>(255) == 255);
  }

  SECTION("values land on the nearest of seven bins") {
    // step = 42.5, bins are 0, 42.5, 85, 127.5, 170, 212.5, 255
    REQUIRE(lut.at<uchar>(21) == 0);
    REQUIRE(lut.at<uchar>(22) == 42);
    REQUIRE(lut.at<uchar>(100) == 85);
    REQUIRE(lut.at<uchar>(128) == 128);
    REQUIRE(lut.at<uchar>(200) == cv::saturate_cast<uchar>(212.5));
  }

  SECTION("posterizing twice changes nothing") {
    for (int v = 0; v < 256; ++v) {
      const uchar once = lut.at<uchar>(v);
      REQUIRE(lut.at<uchar>(once) == once);
    }
  }

  SECTION("fewer than two levels is rejected") {
    REQUIRE_THROWS_AS(MakePosterizeLut(1), std::invalid_argument);
    REQUIRE_THROWS_AS(MakePosterizeLut(0), std::invalid_argument);
  }
}

TEST_CASE("Posterize leaves alpha alone", "[cpu][posterize]") {
  cv::Mat img(2, 2, CV_8UC4, cv::Scalar(100, 30, 240, 77));
  PosterizeInPlace(img, MakePosterizeLut(7));

  const cv::Vec4b px = img.at<cv::Vec4b>(1, 1);
  REQUIRE(px[0] == 85);
  REQUIRE(px[1] == 42);
  REQUIRE(px[2] == 255);
  REQUIRE(px[3] == 77);
}

TEST_CASE("Solid frame has no outlines", "[cpu][edges]") {
  const cv::Mat out = CartoonifyCpu(Solid(cv::Size(4, 4), 200), kCpuStyle);

  REQUIRE(out.size() == cv::Size(4, 4));
  REQUIRE(cv::countNonZero(EdgeMask(Solid(cv::Size(4, 4), 200), kCpuStyle.edge_threshold)) == 0);

  const uchar expected = cv::saturate_cast<uchar>(212.5);
  for (int y = 0; y < out.rows; ++y) {
    for (int x = 0; x < out.cols; ++x) {
      const cv::Vec4b px = out.at<cv::Vec4b>(y, x);
      REQUIRE(px[0] == expected);
      REQUIRE(px[1] == expected);
      REQUIRE(px[2] == expected);
      REQUIRE(px[3] == 255);
    }
  }
}

TEST_CASE("Vertical boundary is outlined in the interior only", "[cpu][edges]") {
  // Left half black, right half white
  cv::Mat img = Solid(cv::Size(8, 8), 0);
  img(cv::Rect(4, 0, 4, 8)).setTo(cv::Scalar(255, 255, 255, 255));

  const cv::Mat mask = EdgeMask(img, kCpuStyle.edge_threshold);
  const cv::Mat out = CartoonifyCpu(img, kCpuStyle);

  SECTION("columns either side of the boundary are edges") {
    for (int y = 1; y < 7; ++y) {
      REQUIRE(mask.at<uchar>(y, 3) == 255);
      REQUIRE(mask.at<uchar>(y, 4) == 255);
      REQUIRE(out.at<cv::Vec4b>(y, 4)[0] == 0);
      REQUIRE(out.at<cv::Vec4b>(y, 4)[3] == 255);
    }
  }

  SECTION("flat regions are not edges") {
    for (int y = 1; y < 7; ++y) {
      REQUIRE(mask.at<uchar>(y, 1) == 0);
      REQUIRE(mask.at<uchar>(y, 6) == 0);
      REQUIRE(out.at<cv::Vec4b>(y, 6)[1] == 255);
    }
  }

  SECTION("border rows and columns are never edges") {
    for (int x = 0; x < 8; ++x) {
      REQUIRE(mask.at<uchar>(0, x) == 0);
      REQUIRE(mask.at<uchar>(7, x) == 0);
    }
    for (int y = 0; y < 8; ++y) {
      REQUIRE(mask.at<uchar>(y, 0) == 0);
      REQUIRE(mask.at<uchar>(y, 7) == 0);
    }
    REQUIRE(out.at<cv::Vec4b>(0, 4)[0] == 255);
  }
}

TEST_CASE("Weak gradients stay under the threshold", "[cpu][edges]") {
  // Step of 10 gray levels: Sobel magnitude 40 < 80
  cv::Mat img = Solid(cv::Size(6, 6), 100);
  img(cv::Rect(3, 0, 3, 6)).setTo(cv::Scalar(110, 110, 110, 255));
  REQUIRE(cv::countNonZero(EdgeMask(img, 80.f)) == 0);
  REQUIRE(cv::countNonZero(EdgeMask(img, 10.f)) > 0);
}

TEST_CASE("Tiny frames have no interior", "[cpu][edges]") {
  cv::Mat img = Solid(cv::Size(2, 2), 0);
  img.at<cv::Vec4b>(0, 0) = cv::Vec4b(255, 255, 255, 255);
  REQUIRE(cv::countNonZero(EdgeMask(img, 0.f)) == 0);
}

TEST_CASE("CpuStylizer processes at a reduced resolution", "[cpu][stylizer]") {
  CpuStylizer stylizer; // 0.5 downscale

  SECTION("output is at processing resolution") {
    const cv::Mat out = stylizer.stylize(Solid(cv::Size(640, 480), 200));
    REQUIRE(out.size() == cv::Size(320, 240));
    REQUIRE(out.type() == CV_8UC4);
    REQUIRE(stylizer.processing_size() == cv::Size(320, 240));
  }

  SECTION("resolution change recomputes the processing size") {
    stylizer.stylize(Solid(cv::Size(640, 480), 200));
    const cv::Mat out = stylizer.stylize(Solid(cv::Size(101, 51), 200));
    REQUIRE(stylizer.processing_size() == cv::Size(50, 25));
    REQUIRE(out.size() == cv::Size(50, 25));
  }

  SECTION("three channel input is accepted") {
    const cv::Mat out = stylizer.stylize(cv::Mat(cv::Size(20, 10), CV_8UC3, cv::Scalar(200, 200, 200)));
    REQUIRE(out.size() == cv::Size(10, 5));
    REQUIRE(out.type() == CV_8UC4);
  }

  SECTION("unsupported input is returned unchanged") {
    const cv::Mat odd(cv::Size(8, 8), CV_16UC2, cv::Scalar(1, 2));
    const cv::Mat out = stylizer.stylize(odd);
    REQUIRE(out.data == odd.data);
  }

  SECTION("empty input is returned unchanged") {
    REQUIRE(stylizer.stylize(cv::Mat()).empty());
  }
}

TEST_CASE("CpuStylizer rejects bad parameters", "[cpu][stylizer]") {
  REQUIRE_THROWS_AS(CpuStylizer(StylizationParameters{1, 80.f, 0.5f}), std::invalid_argument);
  REQUIRE_THROWS_AS(CpuStylizer(StylizationParameters{7, 80.f, 0.f}), std::invalid_argument);
  REQUIRE_THROWS_AS(CpuStylizer(StylizationParameters{7, 80.f, 1.5f}), std::invalid_argument);
  REQUIRE_NOTHROW(CpuStylizer(StylizationParameters{7, 80.f, 1.f}));
}
