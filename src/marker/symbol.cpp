#include "symbol.hpp"

#include "code.hpp"

namespace marker
{
Symbol::Symbol(const int code, const Eigen::Vector2f &center, const float unit, const float orientation)
    : code_(code), center_(center), unit_(unit), orientation_(orientation)
{
}

float Symbol::diameter() const { return unit_ * code::kWidthUnits; }

bool Symbol::in_bullseye(const Eigen::Vector2f &point) const
{
    return (center_ - point).squaredNorm() <= unit_ * unit_;
}
}  // namespace marker
