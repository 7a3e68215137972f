#include "scan_images.hpp"

#include <spdlog/spdlog.h>

#include <io/images_set.hpp>
#include <io/save_path.hpp>
#include <io/scan_parameters_io.hpp>
#include <io/symbols_io.hpp>
#include <marker/debug.hpp>
#include <marker/debugging.hpp>
#include <marker/detection.hpp>

void ScanImages::execute()
{
    marker::ScanParameters parameters =
        params_path_.empty() ? marker::ScanParameters() : io::read_scan_parameters(params_path_);
    if (max_diameter_ > 0)
    {
        parameters.set_max_code_diameter(max_diameter_);
    }

    const std::filesystem::path output_folder = io::output_path(output_folder_);

    const ImageFilesDataset images_set(images_path_);
    const auto descriptors = images_set();

    size_t total_symbols = 0;
    for (const ImageFileDescriptor& descriptor : descriptors)
    {
        const cv::Mat image = descriptor.read_image();
        const auto result = marker::detection::scan(image, parameters);

        if (result.symbols_.empty())
        {
            spdlog::warn("{}: no symbols found ({} candidate pixels, {} tested)", descriptor.stem(),
                         result.candidate_count_, result.tested_count_);
        }
        else
        {
            spdlog::info("{}: found {} symbols ({} candidate pixels, {} tested)", descriptor.stem(),
                         result.symbols_.size(), result.candidate_count_, result.tested_count_);
        }
        for (const auto& symbol : result.symbols_)
        {
            spdlog::info("  code {:4} at ({:7.2f}, {:7.2f}) diameter {:6.2f} orientation {:6.3f}", symbol.code_,
                         symbol.center_.x(), symbol.center_.y(), symbol.diameter(), symbol.orientation_);
        }

        io::save_symbols(result, descriptor.stem(), output_folder);
        if constexpr (kShowMarkers)
        {
            marker::debug::save_symbols(image, result.symbols_, descriptor.stem(), output_folder);
        }
        total_symbols += result.symbols_.size();
    }

    spdlog::info("scanned {} images, {} symbols, results in {}", descriptors.size(), total_symbols,
                 output_folder.string());
}
