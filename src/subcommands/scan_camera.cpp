#include "scan_camera.hpp"

#include <format>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <opencv2/videoio.hpp>

#include <marker/detection.hpp>

void ScanCamera::execute()
{
    marker::ScanParameters parameters;
    if (max_diameter_ > 0)
    {
        parameters.set_max_code_diameter(max_diameter_);
    }

    cv::VideoCapture capture(device_id_);
    if (!capture.isOpened())
    {
        spdlog::error("Capture device {} could not be opened", device_id_);
        throw std::runtime_error(std::format("No camera detected at index {}", device_id_));
    }

    cv::Mat frame;
    int frame_idx = 0;
    // every frame is scanned on its own, nothing is carried over between frames
    while ((frames_ == 0 || frame_idx < frames_) && capture.read(frame))
    {
        if (frame.empty())
        {
            spdlog::warn("frame {}: device returned an empty frame", frame_idx);
            break;
        }

        const auto result = marker::detection::scan(frame, parameters);
        spdlog::info("frame {}: detected {} symbols", frame_idx, result.symbols_.size());
        for (const auto& symbol : result.symbols_)
        {
            spdlog::debug("  code {} at ({:.1f}, {:.1f})", symbol.code_, symbol.center_.x(), symbol.center_.y());
        }
        ++frame_idx;
    }

    spdlog::info("scanned {} frames from device {}", frame_idx, device_id_);
}
