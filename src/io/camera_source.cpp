#include "io/camera_source.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

namespace toon {

CameraSource::CameraSource(CameraConfig cfg, StageMetrics* metrics)
    : cfg_(std::move(cfg)), metrics_(metrics), runner_("camera") {}

CameraSource::~CameraSource() {
  stop();
}

void CameraSource::start(StopToken global_stop) {
  if (runner_.running()) return;
  runner_.join(); // Reap a worker that ended on its own (e.g. denied)

  latest_.reset();
  status_.store(AcquisitionStatus::Opening, std::memory_order_release);
  std::cout << "camera started" << std::endl;

  runner_.start(global_stop, [this](const StopToken& g, const std::atomic_bool& l) {
    run(g, l);
  });
}

void CameraSource::stop() {
  if (!runner_.joinable()) return;

  runner_.stop();
  latest_.reset();
  if (status() != AcquisitionStatus::Denied) {
    status_.store(AcquisitionStatus::Stopped, std::memory_order_release);
  }
  std::cout << "camera stopped" << std::endl;
}

bool CameraSource::ready() const {
  return status() == AcquisitionStatus::Streaming && latest_.has_value() &&
         latest_.version() != seen_version_;
}

bool CameraSource::read(Frame& out) {
  auto f = latest_.read_if_newer(seen_version_);
  if (!f) return false;
  out = std::move(*f);
  return true;
}

void CameraSource::run(const StopToken& global, const std::atomic_bool& local) {
  // cap is our video capture, can be live video stream or recording
  cv::VideoCapture cap;
  if (cfg_.source.empty()) {
    cap.open(cfg_.device_index);
  } else {
    cap.open(cfg_.source);
  }

  if (!cap.isOpened()) {
    std::cerr << "Camera access denied or device unavailable (device " << cfg_.device_index
              << (cfg_.source.empty() ? "" : ", source '" + cfg_.source + "'") << ")\n";
    status_.store(AcquisitionStatus::Denied, std::memory_order_release);
    return;
  }

  // Requested size is only a hint, actual frames may differ
  cap.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
  cap.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
  cap.set(cv::CAP_PROP_FPS, cfg_.fps);
  std::cout << "camera negotiated " << cap.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
            << cap.get(cv::CAP_PROP_FRAME_HEIGHT) << " (requested " << cfg_.width << "x" << cfg_.height << ")"
            << std::endl;

  status_.store(AcquisitionStatus::Streaming, std::memory_order_release);

  cv::Mat img;
  while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
    const auto t0 = NowNs();

    if (!cap.read(img) || img.empty()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      continue;
    }

    if (cfg_.flip_vertical) cv::flip(img, img, 0);
    if (cfg_.flip_horizontal) cv::flip(img, img, 1);

    Frame f;
    f.capture_time = std::chrono::steady_clock::now();
    f.sequence_id = next_id_++;
    cv::cvtColor(img, f.image, img.channels() == 1 ? cv::COLOR_GRAY2BGRA : cv::COLOR_BGR2BGRA);

    latest_.write(std::move(f));
    if (metrics_) metrics_->on_item(NowNs() - t0);
  }
}

} // namespace toon
