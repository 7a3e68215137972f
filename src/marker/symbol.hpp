#pragma once

#include <Eigen/Core>

namespace marker
{
/**
 * @brief Decoded marker. Center is in pixel coordinates (x = col, y = row), unit is the width of a single ring and
 * orientation is in radians.
 */
class Symbol
{
   public:
    const int code_;
    const Eigen::Vector2f center_;
    const float unit_;
    const float orientation_;

    Symbol(const int code, const Eigen::Vector2f &center, const float unit, const float orientation);

    float diameter() const;

    bool is_valid() const { return code_ > 0; }

    /**
     * @brief True if point lies inside the bullseye (within one unit of the center).
     */
    bool in_bullseye(const Eigen::Vector2f &point) const;
};
}  // namespace marker
