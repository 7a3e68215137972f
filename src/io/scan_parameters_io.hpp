#pragma once

#include <filesystem>

#include <marker/scan_parameters.hpp>

namespace io
{
/**
 * @brief Read scan parameters from json. Keys that are not present keep their default value.
 *
 * @throws std::invalid_argument if file does not exist, is not valid json, holds a value of wrong type or a value
 * rejected by ScanParameters::validate
 */
marker::ScanParameters read_scan_parameters(const std::filesystem::path& filepath);

}  // namespace io
