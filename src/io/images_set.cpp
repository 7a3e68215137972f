#include "images_set.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <opencv2/imgcodecs.hpp>

bool ImageFilesDataset::read_images_filenames(std::vector<ImageFileDescriptor>& result) const
{
    for (const std::filesystem::path& entry : std::filesystem::directory_iterator(path_))
    {
        if (ImageFileDescriptor::is_valid(entry))
        {
            result.emplace_back(entry);
        }
    }

    std::sort(result.begin(), result.end(),
              [](const ImageFileDescriptor& lhs, const ImageFileDescriptor& rhs) { return lhs.path() < rhs.path(); });

    return !result.empty();
}

std::vector<ImageFileDescriptor> ImageFilesDataset::operator()() const
{
    if (std::filesystem::is_regular_file(path_))
    {
        return {ImageFileDescriptor(path_)};
    }

    if (!std::filesystem::is_directory(path_))
    {
        spdlog::error("{} is neither an image nor a directory", path_.string());
        throw std::runtime_error("not an image or directory");
    }

    std::vector<ImageFileDescriptor> result;
    if (!read_images_filenames(result))
    {
        spdlog::error("No images were found at dir {}", path_.string());
        throw std::runtime_error("No images to scan");
    }
    spdlog::info("Found {} images at {}", result.size(), path_.string());
    return result;
}

cv::Mat ImageFileDescriptor::read_image() const
{
    cv::Mat img = cv::imread(path(), cv::IMREAD_COLOR);
    if (img.empty())
    {
        spdlog::error("Cannot read image {}", path());
        throw std::runtime_error("Image not found or unreadable");
    }
    return img;
}
