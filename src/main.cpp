#include <iostream>
#include <fstream>
#include <chrono>
#include <opencv2/videoio.hpp>
#include "../include/config.hpp"
#include "../include/detection_source.hpp"
#include "../include/errors.hpp"
#include "../include/overlay.hpp"
#include "../include/vehicle_counter.hpp"

inline bool exists(const std::string& name) {
    std::ifstream f(name.c_str());
    return f.good();
}

static void printCounts(const CountSnapshot& counts) {
    for (const auto& counter : counts.counters) {
        std::cout << "  " << counter.first << ": " << counter.second << std::endl;
    }
    std::cout << "  total: " << counts.total << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.yml> <detections.yml> [input_video]" << std::endl;
        return -1;
    }

    const std::string config_file = argv[1];
    const std::string detections_file = argv[2];
    const std::string input_video = argc > 3 ? argv[3] : "";

    if (!exists(config_file) || !exists(detections_file) ||
        (!input_video.empty() && !exists(input_video))) {
        std::cerr << "Error: File not found." << std::endl;
        return -1;
    }

    CounterConfig config;
    try {
        config = loadConfig(config_file);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return -1;
    }

    Logger logger(config.debug ? ILogger::Severity::kINFO : ILogger::Severity::kWARNING);
    DetectionReplay replay(&logger);
    if (!replay.open(detections_file)) {
        return -1;
    }

    cv::Size frame_size = replay.frameSize();
    cv::VideoCapture cap;
    cv::VideoWriter writer;
    std::string output_file = "result.avi";
    if (!input_video.empty()) {
        cap.open(input_video);
        if (!cap.isOpened()) {
            std::cerr << "Error: Cannot open video file." << std::endl;
            return -1;
        }
        frame_size = cv::Size(static_cast<int>(cap.get(cv::CAP_PROP_FRAME_WIDTH)),
                              static_cast<int>(cap.get(cv::CAP_PROP_FRAME_HEIGHT)));
        double fps = cap.get(cv::CAP_PROP_FPS);
        if (fps <= 0) fps = replay.fps();

        writer.open(output_file, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), fps, frame_size);
        if (!writer.isOpened()) {
            std::cerr << "Error: Cannot create output video writer." << std::endl;
            return -1;
        }
        std::cout << "Output set to: " << output_file << " (MJPG codec)" << std::endl;
    }

    VehicleCounter counter(config, &logger);
    if (frame_size.height > 0) {
        counter.configure(frame_size.height, config.lines);
    }

    std::cout << "Replaying " << replay.frameCount() << " frames in " << toString(config.mode)
              << " mode" << std::endl;

    const Timestamp start = Clock::now();
    FrameDetections frame;
    cv::Mat img;
    int frame_count = 0;

    while (replay.next(frame) == FrameStatus::kFrame) {
        if (cap.isOpened()) {
            cap >> img;
            if (img.empty()) {
                std::cout << "End of video." << std::endl;
                break;
            }
        }

        // Replay timestamps drive track expiry, not the wall clock of this run
        const Timestamp now = start + std::chrono::duration_cast<Clock::duration>(
                                          std::chrono::duration<double>(frame.timestamp_seconds));

        FrameResult result;
        try {
            result = counter.process(frame.detections, frame_size, now);
        } catch (const NotConfiguredError& e) {
            std::cerr << "Error: " << e.what() << " (frame size unknown; set frame_width/frame_height "
                      << "in the detection file or pass a video)" << std::endl;
            return -1;
        }

        if (!img.empty()) {
            drawOverlay(img, result);
            writer.write(img);
        }

        frame_count++;
        if (frame_count % 30 == 0) {
            std::cout << "Frame " << frame_count << "/" << replay.frameCount()
                      << " - total " << result.counts.total << std::endl;
        }
    }

    if (cap.isOpened()) {
        cap.release();
        writer.release();
        std::cout << "Done! File saved: " << output_file << std::endl;
    }

    std::cout << "Counts after " << frame_count << " frames:" << std::endl;
    printCounts(counter.getCounts());
    return 0;
}
