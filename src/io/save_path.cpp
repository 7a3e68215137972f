#include "save_path.hpp"

#include <cstdlib>
#include <format>
#include <optional>
#include <stdexcept>

namespace
{
static constexpr const char* const kSavePathEnvName = "TOPCODE_SAVE_PATH";
static constexpr const char* const kDefaultDirName = ".topcode";
static constexpr const char* const kDebugDirName = "debug";

std::optional<std::filesystem::path> from_env(const char* const name)
{
    const char* const value = std::getenv(name);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}

std::filesystem::path home_directory()
{
    // USERPROFILE covers Windows
    for (const char* const name : {"HOME", "USERPROFILE"})
    {
        if (auto home = from_env(name))
        {
            return *home;
        }
    }
    throw std::runtime_error(std::format("No home directory to save results in, set {} environment variable.",
                                         kSavePathEnvName));
}

std::filesystem::path ensure_exists(const std::filesystem::path& directory)
{
    std::filesystem::create_directories(directory);
    return directory;
}
}  // namespace

namespace io
{
std::filesystem::path save_path()
{
    if (auto configured = from_env(kSavePathEnvName))
    {
        return ensure_exists(*configured);
    }
    return ensure_exists(home_directory() / kDefaultDirName);
}

std::filesystem::path output_path(const std::filesystem::path& requested)
{
    return requested.empty() ? save_path() : requested;
}

std::filesystem::path debug_save_path() { return ensure_exists(save_path() / kDebugDirName); }
}  // namespace io
