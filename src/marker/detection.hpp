#pragma once

#include <filesystem>
#include <vector>

#include <opencv2/core.hpp>

#include "raster.hpp"
#include "scan_parameters.hpp"
#include "symbol.hpp"

namespace marker::detection
{
struct ScanResult
{
    // in discovery order, top to bottom
    std::vector<Symbol> symbols_;

    int cols_ = 0;
    int rows_ = 0;

    // pixels flagged by the thresholder
    int candidate_count_ = 0;
    // flagged pixels confirmed by all four neighbours
    int tested_count_ = 0;
    // confirmed candidates outside of already found symbols, handed to the decoder
    int decoded_count_ = 0;
};

/**
 * @brief True if point lies in the bullseye of any of the symbols.
 */
bool overlaps(const std::vector<Symbol> &symbols, const Eigen::Vector2f &point);

/**
 * @brief Sweep thresholded raster for confirmed bullseye candidates and decode each of them. Candidate needs its left,
 * right, upper and lower neighbour flagged as well, candidates inside already decoded symbols are skipped.
 */
ScanResult find_symbols(const Raster &raster, const ScanParameters &parameters);

/**
 * @brief Threshold and scan an in memory image. Every call works on its own raster.
 *
 * @throws std::invalid_argument for empty image, unsupported image type or invalid parameters
 */
ScanResult scan(const cv::Mat &image, const ScanParameters &parameters = ScanParameters());

/**
 * @brief Read image from disc and scan it.
 *
 * @throws std::invalid_argument for invalid parameters
 * @throws std::runtime_error if image cannot be read
 */
ScanResult scan(const std::filesystem::path &image_path, const ScanParameters &parameters = ScanParameters());

}  // namespace marker::detection
