#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include <marker/detection.hpp>

namespace io
{
nlohmann::json to_json(const marker::Symbol& symbol);

/**
 * @brief Symbols together with image size and scan counters.
 */
nlohmann::json to_json(const marker::detection::ScanResult& result);

/**
 * @brief Write scan result as `<output_dir>/symbols_<name>.json`.
 *
 * @returns path of the written file
 */
std::filesystem::path save_symbols(const marker::detection::ScanResult& result, const std::string& name,
                                   const std::filesystem::path& output_dir);

}  // namespace io
