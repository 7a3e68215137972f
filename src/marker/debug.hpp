#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include <opencv2/core.hpp>

#include "symbol.hpp"

namespace marker::debug
{
static constexpr std::string_view kMarkersSubdir = "markers";

/**
 * @brief Paint outline, center and orientation of each symbol together with its code.
 */
cv::Mat3b paint_symbols(const cv::Mat &image, const std::vector<Symbol> &symbols);

/**
 * @brief Save painted symbols to `debug_save_path()/markers` (or to `output_path` if given).
 */
void save_symbols(const cv::Mat &image, const std::vector<Symbol> &symbols, const std::filesystem::path &name,
                  const std::filesystem::path &output_path = {});
}  // namespace marker::debug
