#include <iostream>

#include <stdexcept>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include "core/config_loader.hpp"
#include "infra/metrics.hpp"
#include "io/video_file_source.hpp"
#include "pipeline/frame_scheduler.hpp"
#include "pipeline/refresh_driver.hpp"
#include "present/surface.hpp"
#include "stylize/stylizer.hpp"

// toonycam_replay is a debugging tool
// Runs the stylizer over every frame of a recorded video and writes the stylized result

int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "usage: " << argv[0] << " <config.yaml> <input video> <output video>\n";
    return 2;
  }
  const std::string cfg_path = argv[1];
  const std::string in_path = argv[2];
  const std::string out_path = argv[3];

  try {
    toon::AppConfig cfg = toon::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    std::unique_ptr<toon::Stylizer> stylizer = toon::MakeStylizer(cfg.stylize);
    if (!stylizer->ready()) {
      std::cerr << "Stylizer unavailable: " << stylizer->status() << "\n";
      return 1;
    }

    toon::Metrics metrics;
    toon::StageMetrics* stylize_metrics = metrics.make_stage("stylize");

    toon::VideoFileSource source(in_path);
    toon::CanvasSurface surface(cv::Size(cfg.presentation.width, cfg.presentation.height));
    toon::DisplayRefreshDriver driver(0);
    toon::FrameScheduler scheduler(source, *stylizer, surface, driver, stylize_metrics);

    const std::string& fc = cfg.recording.fourcc;
    const int fourcc = cv::VideoWriter::fourcc(fc[0], fc[1], fc[2], fc[3]);
    cv::VideoWriter writer;
    cv::Mat bgr;
    std::uint64_t written = 0;
    bool writer_failed = false;

    // Opened on the first presented frame, once the canvas size is known
    scheduler.set_on_presented([&](const cv::Mat& canvas) {
      if (!writer.isOpened()) {
        if (!writer.open(out_path, fourcc, source.fps(), canvas.size(), true)) {
          writer_failed = true;
          throw std::runtime_error("cannot open output video '" + out_path + "'");
        }
        std::cout << "Writing " << canvas.cols << "x" << canvas.rows << " to " << out_path << std::endl;
      }
      cv::cvtColor(canvas, bgr, cv::COLOR_BGRA2BGR);
      writer.write(bgr);
      ++written;
    });

    scheduler.start();
    while (scheduler.running() && !source.exhausted()) {
      driver.pump();
      if (writer_failed) {
        std::cerr << "Output writer failed, aborting\n";
        return 1;
      }
    }
    scheduler.stop();
    writer.release();

    const auto& st = scheduler.stats();
    std::cout << "Replay done: " << source.frames_read() << " frames read, " << written << " written, "
              << st.failures << " failures" << std::endl;
    if (written == 0) {
      std::cerr << "No frames written\n";
      return 1;
    }

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
