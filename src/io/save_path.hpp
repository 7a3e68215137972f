#pragma once

#include <filesystem>

namespace io
{
/**
 * @brief Root directory of scan output, `TOPCODE_SAVE_PATH` if set, `~/.topcode` otherwise. Created on first use.
 *
 * @throws std::runtime_error when neither the variable nor a home directory is available
 */
std::filesystem::path save_path();

/**
 * @brief Directory results are written to, `requested` unless it is empty, `save_path()` otherwise.
 */
std::filesystem::path output_path(const std::filesystem::path& requested);

/**
 * @brief `save_path()/debug`, created on first use.
 */
std::filesystem::path debug_save_path();
}  // namespace io
