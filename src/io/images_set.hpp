#pragma once

#include <algorithm>
#include <array>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core/mat.hpp>

/*
 * @brief Image file found on disc. Images are read lazily, one at a time, so that large directories never need to be
 * kept in memory.
 */
class ImageFileDescriptor
{
    static constexpr std::array<std::string_view, 5> kPossibleExtensions = {".bmp", ".png", ".tiff", ".jpg", ".jpeg"};

   public:
    explicit ImageFileDescriptor(const std::filesystem::path& entry) : path_(entry) {};

    /**
     * @throws std::runtime_error if file cannot be decoded as an image
     */
    cv::Mat read_image() const;

    static bool is_valid(const std::filesystem::path& entry)
    {
        return std::filesystem::is_regular_file(entry) && is_valid_image(entry);
    }

    std::string path() const { return path_.string(); }

    std::string stem() const { return path_.stem().string(); }

   private:
    static bool is_valid_image(const std::filesystem::path& entry)
    {
        return std::any_of(kPossibleExtensions.cbegin(), kPossibleExtensions.cend(), [&entry](const auto& extension)
                           { return entry.extension().string().compare(extension) == 0; });
    }
    std::filesystem::path path_;
};

/*
 * @brief Images to scan, either a single file or all images of a directory sorted by file name.
 */
class ImageFilesDataset
{
   public:
    explicit ImageFilesDataset(const std::filesystem::path& path) : path_(path) {};

    /**
     * @throws std::runtime_error if path does not exist or a directory holds no images
     */
    std::vector<ImageFileDescriptor> operator()() const;

   private:
    const std::filesystem::path path_;

    bool read_images_filenames(std::vector<ImageFileDescriptor>& result) const;
};
