#pragma once

#include <optional>

#include <Eigen/Core>

#include "raster.hpp"
#include "scan_parameters.hpp"
#include "symbol.hpp"

namespace marker::decoder
{
/**
 * @brief Result of sampling the data ring with one (unit, arc offset) hypothesis. Zero confidence means the ring
 * structure did not match or the checksum failed, bits are then kInvalidCode.
 */
struct Reading
{
    int confidence_ = 0;
    int bits_ = -1;
};

/**
 * @brief Move seed point to the middle of the bullseye. Three parallel rays are cast in each of the four directions,
 * center is shifted by half of the averaged difference between opposite directions.
 */
Eigen::Vector2f refine_center(const Raster &raster, const int col, const int row);

/**
 * @brief Estimate ring width from the center. In each direction distance to the outer edge of the first black ring is
 * measured, the four distances span 8 units together.
 *
 * @returns unit length, or -1 when the walk hits raster border or max distance before all edges were found, or
 * horizontal and vertical extents differ by more than a unit
 */
float read_unit(const Raster &raster, const Eigen::Vector2f &center, const int max_distance);

/**
 * @brief Sample all 13 sectors with given ring width and angular offset.
 *
 * Each sector is sampled at 8 points across the whole diameter:
 *
 *   0     1     2     3  (center)  4     5     6     7
 *   data  white black white      white black white data
 *   (opposite side)                                (this sector)
 */
Reading read_code(const Raster &raster, const Eigen::Vector2f &center, const float unit, const float arc_offset);

/**
 * @brief Decode marker around seed point lying inside its bullseye.
 *
 * @returns symbol with canonical code and orientation, std::nullopt when no sampling hypothesis produced a valid code
 */
std::optional<Symbol> decode(const Raster &raster, const int col, const int row, const ScanParameters &parameters);
}  // namespace marker::decoder
