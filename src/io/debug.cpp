#include "debug.hpp"

#include <string_view>
#include <unordered_map>

#include <spdlog/spdlog.h>
#include <opencv2/imgcodecs.hpp>

namespace
{
// painted previews are the only debug images
const std::unordered_map<int, std::string_view> kMatTypeToExtension{
    {CV_8UC3, ".png"},
};
}  // namespace

namespace io
{
void debug::save_image(const cv::Mat& image, const std::filesystem::path& name, const std::filesystem::path& subdir)
{
    save_image_to(image, name, debug_save_path() / subdir);
}

void debug::save_image_to(const cv::Mat& image, const std::filesystem::path& name,
                          const std::filesystem::path& directory)
{
    std::filesystem::create_directories(directory);

    std::filesystem::path full_filepath = directory / name;
    full_filepath.replace_extension(kMatTypeToExtension.at(image.type()));
    spdlog::debug("Saving image to {}", full_filepath.string());

    if (!cv::imwrite(full_filepath.string(), image))
    {
        spdlog::warn("Could not write {}", full_filepath.string());
    }
}
}  // namespace io
