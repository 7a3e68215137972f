#pragma once

#include <filesystem>

#include <opencv2/core/mat.hpp>

#include "save_path.hpp"

/* @brief Debug image output. Nothing here is needed for a scan, callers guard it with the flags of
 * `marker/debugging.hpp`.
 */
namespace io::debug
{
/* @brief Write 8 bit BGR image into `debug_save_path()/subdir` as .png.
 */
void save_image(const cv::Mat& image, const std::filesystem::path& name,
                const std::filesystem::path& subdir = std::filesystem::path());

/* @brief Write image into an explicit directory, created when missing.
 */
void save_image_to(const cv::Mat& image, const std::filesystem::path& name, const std::filesystem::path& directory);
}  // namespace io::debug
