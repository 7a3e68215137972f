#pragma once

#include "raster.hpp"
#include "scan_parameters.hpp"

/**
 * @brief Single pass adaptive binarization (Wellner method) with bullseye candidate marking.
 * "Adaptive Thresholding for the DigitalDesk", EuroPARC Technical Report EPC-93-110
 */
namespace thresholds
{
enum class ScanDirection
{
    LEFT_TO_RIGHT,
    RIGHT_TO_LEFT
};

/**
 * @brief Visiting order of a single row. Even rows go left to right, odd rows right to left, so consecutive pixels of
 * the whole image stay neighbours.
 */
struct RowTraversal
{
    const int row_;
    const int cols_;
    const ScanDirection direction_;

    RowTraversal(const int row, const int cols);

    int col(const int step) const { return direction_ == ScanDirection::LEFT_TO_RIGHT ? step : cols_ - 1 - step; }

    /**
     * @brief Column lying `distance` pixels behind `col` along the scan direction.
     */
    int behind(const int col, const int distance) const
    {
        return direction_ == ScanDirection::LEFT_TO_RIGHT ? col - distance : col + distance;
    }
};

/**
 * @brief Run lengths of the black / white / black pattern seen so far in the current row.
 */
struct RunState
{
    enum class Level
    {
        WHITE,
        FIRST_BLACK,
        MIDDLE_WHITE,
        SECOND_BLACK
    };

    Level level_ = Level::WHITE;
    int b1_ = 0;
    int w1_ = 0;
    int b2_ = 0;
};

/**
 * @brief Test run lengths of a finished black, white, black sequence against bullseye proportions: both black rings of
 * similar width and the white center about as wide as both of them together.
 *
 * @param max_unit widest accepted ring in pixels
 */
bool is_bullseye(const int b1, const int w1, const int b2, const int max_unit, const int min_ring_width = 2);

/**
 * @brief Binarize raster in place and flag pixels at the middle of bullseye patterns. Intensity plane is overwritten
 * with the running sum.
 *
 * @returns number of flagged candidate pixels
 */
int adaptive_threshold(marker::Raster &raster, const marker::ScanParameters &parameters);

}  // namespace thresholds
