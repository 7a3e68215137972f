#include "raster.hpp"

#include <format>
#include <stdexcept>

namespace marker
{
Raster::Raster(const cv::Mat &image)
{
    if (image.empty())
    {
        throw std::invalid_argument("Cannot scan an empty image");
    }

    intensity_.create(image.rows, image.cols);
    binary_ = cv::Mat1b::zeros(image.rows, image.cols);
    candidates_ = cv::Mat1b::zeros(image.rows, image.cols);

    switch (image.type())
    {
        case CV_8UC1:
        {
            image.convertTo(intensity_, CV_32S);
            break;
        }
        case CV_8UC3:
        {
            for (int row = 0; row < image.rows; ++row)
            {
                const cv::Vec3b *const pixels = image.ptr<cv::Vec3b>(row);
                for (int col = 0; col < image.cols; ++col)
                {
                    intensity_(row, col) = (int(pixels[col][0]) + int(pixels[col][1]) + int(pixels[col][2])) / 3;
                }
            }
            break;
        }
        case CV_8UC4:
        {
            for (int row = 0; row < image.rows; ++row)
            {
                const cv::Vec4b *const pixels = image.ptr<cv::Vec4b>(row);
                for (int col = 0; col < image.cols; ++col)
                {
                    intensity_(row, col) = (int(pixels[col][0]) + int(pixels[col][1]) + int(pixels[col][2])) / 3;
                }
            }
            break;
        }
        default:
            throw std::invalid_argument(
                std::format("Unsupported image type {}, expected 8 bit grey, BGR or BGRA", image.type()));
    }
}

cv::Mat3b Raster::preview() const
{
    cv::Mat3b painted(rows(), cols());
    for (int row = 0; row < rows(); ++row)
    {
        for (int col = 0; col < cols(); ++col)
        {
            if (is_candidate(col, row))
            {
                painted(row, col) = cv::Vec3b(0, 255, 0);
            }
            else
            {
                const uchar value = is_white(col, row) ? 255 : 0;
                painted(row, col) = cv::Vec3b(value, value, value);
            }
        }
    }
    return painted;
}
}  // namespace marker
