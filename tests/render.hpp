#pragma once

#include <vector>

#include <opencv2/core.hpp>

namespace test
{
/**
 * @brief Paint a TopCode with hard edges onto grey image. Pixel (row, col) is treated as a point at its center.
 *
 * Bit `s` of code fills data sector spanning angles [orientation + s * arc, orientation + (s + 1) * arc], angles grow
 * clockwise on screen (image rows grow downwards).
 */
void render_symbol(cv::Mat1b &image, const int code, const double col_center, const double row_center,
                   const double unit, const double orientation);

/**
 * @brief White image with a single rendered symbol.
 */
cv::Mat1b single_symbol_image(const int rows, const int cols, const int code, const double col_center,
                              const double row_center, const double unit, const double orientation);

/**
 * @brief All values with valid checksum that are their own canonical rotation.
 */
std::vector<int> canonical_codes();

/**
 * @brief Signed difference of two angles wrapped to [-pi, pi).
 */
double angle_difference(const double lhs, const double rhs);
}  // namespace test
