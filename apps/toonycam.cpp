#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>

#include <opencv2/highgui.hpp>  // cv::waitKey

#include "apps/console_stats.hpp"
#include "core/config_loader.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "io/camera_source.hpp"
#include "pipeline/frame_scheduler.hpp"
#include "pipeline/refresh_driver.hpp"
#include "present/still_capture.hpp"
#include "present/video_recorder.hpp"
#include "present/window_surface.hpp"
#include "stylize/stylizer.hpp"

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

static constexpr const char* kDeniedNotice = "Camera access denied. Please check the camera and try again.";

// toonycam: live camera -> stylizer -> window, with still and video capture
// Keys: SPACE start/stop, c capture, s save, d discard, r record, q/ESC quit

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    toon::AppConfig cfg = toon::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    std::signal(SIGINT, HandleSigint);
    toon::StopSource global_stop;

    toon::Metrics metrics;
    toon::StageMetrics* capture_metrics = metrics.make_stage("capture");
    toon::StageMetrics* stylize_metrics = metrics.make_stage("stylize");

    // The stylizer outlives everything that can call it
    std::unique_ptr<toon::Stylizer> stylizer = toon::MakeStylizer(cfg.stylize);
    if (!stylizer->ready()) {
      std::cerr << "Stylizer unavailable: " << stylizer->status() << "\n";
      return 1;
    }

    toon::CameraSource camera(cfg.camera, capture_metrics);
    toon::WindowSurface surface(cfg.presentation.window_name,
                                cv::Size(cfg.presentation.width, cfg.presentation.height),
                                std::chrono::milliseconds(cfg.presentation.notice_ms));
    toon::DisplayRefreshDriver driver(cfg.presentation.refresh_hz);
    toon::FrameScheduler scheduler(camera, *stylizer, surface, driver, stylize_metrics);
    toon::VideoRecorder recorder(cfg.recording, cfg.capture);
    toon::ConsoleStats stats(metrics, std::chrono::milliseconds(cfg.metrics.log_interval_ms), std::cout);

    scheduler.set_on_presented([&recorder](const cv::Mat& canvas) {
      if (recorder.recording()) recorder.write(canvas);
    });

    cv::Mat pending_still;

    auto start_camera = [&]() {
      camera.start(global_stop.token());
      scheduler.start();
    };

    auto stop_camera = [&]() {
      if (recorder.recording()) recorder.stop();
      scheduler.stop();
      camera.stop();
      surface.reset();
    };

    start_camera();

    while (!global_stop.stop_requested()) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        std::cout << "\nShutting down..." << std::endl;
        global_stop.request_stop();
        break;
      }

      driver.pump();
      if (!scheduler.running()) surface.refresh();

      if (scheduler.running() && camera.status() == toon::AcquisitionStatus::Denied) {
        stop_camera();
        surface.show_notice(kDeniedNotice);
      }

      if (cfg.metrics.enable_console_log) stats.maybe_print();

      const int key = cv::waitKey(1);
      if (key < 0) continue;

      try {
        switch (key) {
          case ' ':
            if (scheduler.running()) {
              stop_camera();
            } else {
              start_camera();
            }
            break;

          case 'c':
            if (!surface.valid()) {
              surface.show_notice("Nothing to capture yet");
              break;
            }
            pending_still = surface.snapshot();
            surface.show_notice("Still captured: s to save, d to discard");
            break;

          case 'r':
            if (recorder.recording()) {
              recorder.stop();
              surface.show_notice("Recording stopped: s to save, d to discard");
            } else if (surface.valid()) {
              recorder.start(surface.size());
              surface.show_notice("Recording...");
            }
            break;

          case 's':
            if (!pending_still.empty()) {
              const std::string path = toon::SaveStill(pending_still, cfg.capture);
              pending_still.release();
              std::cout << "Saved still: " << path << std::endl;
              surface.show_notice("Saved " + path);
            } else if (recorder.has_pending_take()) {
              const std::string path = recorder.save();
              std::cout << "Saved recording: " << path << std::endl;
              surface.show_notice("Saved " + path);
            }
            break;

          case 'd':
            if (!pending_still.empty()) {
              pending_still.release();
              surface.show_notice("Still discarded");
            } else if (recorder.has_pending_take()) {
              recorder.discard();
              surface.show_notice("Recording discarded");
            }
            break;

          case 'q':
          case 27:
            std::cout << "User exited. Shutting down..." << std::endl;
            global_stop.request_stop();
            break;

          default:
            break;
        }
      } catch (const std::exception& e) {
        // Capture failures are reported, the live view keeps running
        std::cerr << "capture: " << e.what() << "\n";
        surface.show_notice(e.what());
      }
    }

    // Scheduler first, then the capture thread; the stylizer goes last when main returns
    if (recorder.recording()) recorder.stop();
    scheduler.stop();
    camera.stop();

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
