#include "scan_parameters.hpp"

#include <cmath>
#include <format>
#include <stdexcept>
#include <string_view>

#include "code.hpp"

namespace
{
void check_positive(const int value, const std::string_view name)
{
    if (value <= 0)
    {
        throw std::invalid_argument(std::format("Scan parameter '{}' must be positive, got {}", name, value));
    }
}
}  // namespace

namespace marker
{
ScanParameters::ScanParameters(const int max_code_diameter) { set_max_code_diameter(max_code_diameter); }

void ScanParameters::set_max_code_diameter(const int diameter)
{
    if (diameter <= 0)
    {
        throw std::invalid_argument(std::format("Maximal code diameter must be positive, got {}", diameter));
    }
    max_code_diameter_ = diameter;
}

int ScanParameters::max_unit() const
{
    return int(std::ceil(float(max_code_diameter_) / float(code::kWidthUnits)));
}

void ScanParameters::validate() const
{
    check_positive(max_code_diameter_, "max_code_diameter");
    check_positive(window_size_, "window_size");
    check_positive(arc_steps_, "arc_steps");
    check_positive(max_unit_estimate_distance_, "max_unit_estimate_distance");
}
}  // namespace marker
