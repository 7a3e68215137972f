#pragma once

#include "raster.hpp"

namespace marker::sampling
{
static constexpr int kOutOfBounds = -1;

enum class Axis
{
    HORIZONTAL,
    VERTICAL
};

/**
 * @brief Majority of binarized pixels in 3x3 window around (col, row), 1 for white and 0 for black.
 *
 * @returns kOutOfBounds if window does not fit inside raster
 */
int bw_3x3(const Raster &raster, const int col, const int row);

/**
 * @brief Average of binarized pixels in 3x3 window scaled to 0 (black) .. 255 (white).
 *
 * @returns kOutOfBounds if window does not fit inside raster
 */
int sample_3x3(const Raster &raster, const int col, const int row);

/**
 * @brief Count pixels from (col, row) along axis until majority color flips.
 *
 *    start          flip
 *      X----------->|
 *      |  distance  |
 *
 * @param step +1 or -1, walking direction along axis
 * @returns number of steps to the first flip, -1 if raster border was reached first
 */
int ray_distance(const Raster &raster, const int col, const int row, const Axis axis, const int step);
}  // namespace marker::sampling
