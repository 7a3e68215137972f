#pragma once

#include <opencv2/core.hpp>

namespace marker
{
/**
 * @brief Per pixel state of a single scan. Holds the pixel intensity until the thresholder replaces it with the running
 * sum, the binary classification (1 white, 0 black) and the bullseye candidate flag.
 *
 * A raster is owned by exactly one scan, it is written once by the thresholder and only read afterwards.
 */
class Raster
{
   public:
    cv::Mat1i intensity_;
    cv::Mat1b binary_;
    cv::Mat1b candidates_;

    /**
     * @brief Build raster from 8 bit image with 1, 3 or 4 channels. Colour intensity is the integer mean of the first
     * three channels, alpha is ignored.
     *
     * @throws std::invalid_argument for empty image or unsupported type
     */
    explicit Raster(const cv::Mat &image);

    int cols() const { return intensity_.cols; }

    int rows() const { return intensity_.rows; }

    bool inside(const int col, const int row) const { return col >= 0 && row >= 0 && col < cols() && row < rows(); }

    bool is_white(const int col, const int row) const { return binary_(row, col) != 0; }

    bool is_candidate(const int col, const int row) const { return candidates_(row, col) != 0; }

    int running_sum(const int col, const int row) const { return intensity_(row, col); }

    /**
     * @brief Thresholded image with candidate pixels painted green.
     */
    cv::Mat3b preview() const;
};
}  // namespace marker
