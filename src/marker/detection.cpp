#include "detection.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <opencv2/imgcodecs.hpp>

#include "decoder.hpp"
#include "thresholds.hpp"

namespace
{
// rows closer to the border miss vertical context for neighbour confirmation and unit estimation
static constexpr int kBorderRows = 2;

bool is_confirmed(const marker::Raster &raster, const int col, const int row)
{
    return raster.is_candidate(col, row) && raster.is_candidate(col - 1, row) && raster.is_candidate(col + 1, row) &&
           raster.is_candidate(col, row - 1) && raster.is_candidate(col, row + 1);
}
}  // namespace

namespace marker
{
bool detection::overlaps(const std::vector<Symbol> &symbols, const Eigen::Vector2f &point)
{
    return std::any_of(symbols.cbegin(), symbols.cend(),
                       [&point](const Symbol &symbol) { return symbol.in_bullseye(point); });
}

detection::ScanResult detection::find_symbols(const Raster &raster, const ScanParameters &parameters)
{
    ScanResult result;
    result.cols_ = raster.cols();
    result.rows_ = raster.rows();

    for (int row = kBorderRows; row < raster.rows() - kBorderRows; ++row)
    {
        for (int col = 1; col < raster.cols() - 1; ++col)
        {
            if (!is_confirmed(raster, col, row))
            {
                continue;
            }
            ++result.tested_count_;

            if (overlaps(result.symbols_, Eigen::Vector2f(col, row)))
            {
                continue;
            }
            ++result.decoded_count_;

            auto symbol = decoder::decode(raster, col, row, parameters);
            if (!symbol.has_value())
            {
                spdlog::trace("candidate ({}, {}) rejected", col, row);
                continue;
            }

            spdlog::debug("candidate ({}, {}) decoded as {} at ({:.1f}, {:.1f}), unit {:.2f}, orientation {:.3f}", col,
                          row, symbol->code_, symbol->center_.x(), symbol->center_.y(), symbol->unit_,
                          symbol->orientation_);
            result.symbols_.emplace_back(symbol.value());
        }
    }
    return result;
}

detection::ScanResult detection::scan(const cv::Mat &image, const ScanParameters &parameters)
{
    parameters.validate();
    Raster raster(image);

    const int candidates = thresholds::adaptive_threshold(raster, parameters);

    ScanResult result = find_symbols(raster, parameters);
    result.candidate_count_ = candidates;

    spdlog::debug("scan: {} candidate pixels, {} tested, {} decoded, {} symbols", result.candidate_count_,
                  result.tested_count_, result.decoded_count_, result.symbols_.size());
    return result;
}

detection::ScanResult detection::scan(const std::filesystem::path &image_path, const ScanParameters &parameters)
{
    parameters.validate();

    const cv::Mat image = cv::imread(image_path.string(), cv::IMREAD_COLOR);
    if (image.empty())
    {
        spdlog::error("Cannot read image {}", image_path.string());
        throw std::runtime_error(std::format("Image {} not found or unreadable", image_path.string()));
    }
    return scan(image, parameters);
}
}  // namespace marker
