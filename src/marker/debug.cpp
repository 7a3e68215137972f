#include "debug.hpp"

#include <cmath>

#include <opencv2/imgproc.hpp>

#include <io/debug.hpp>

namespace
{
cv::Mat3b to_color(const cv::Mat &image)
{
    cv::Mat3b painted;
    switch (image.channels())
    {
        case 1:
            cv::cvtColor(image, painted, cv::COLOR_GRAY2BGR);
            break;
        case 4:
            cv::cvtColor(image, painted, cv::COLOR_BGRA2BGR);
            break;
        default:
            painted = image.clone();
            break;
    }
    return painted;
}
}  // namespace

namespace marker
{
cv::Mat3b debug::paint_symbols(const cv::Mat &image, const std::vector<Symbol> &symbols)
{
    cv::Mat3b painted = to_color(image);

    for (const auto &symbol : symbols)
    {
        const cv::Point2f center(symbol.center_.x(), symbol.center_.y());
        const float radius = symbol.diameter() / 2.0f;
        const cv::Point2f heading(center.x + radius * std::cos(symbol.orientation_),
                                  center.y + radius * std::sin(symbol.orientation_));

        cv::circle(painted, center, int(radius), cv::Scalar(0, 0, 255), 1);
        cv::circle(painted, center, 2, cv::Scalar(0, 255, 0), -1);
        cv::line(painted, center, heading, cv::Scalar(255, 0, 0), 1);
        cv::putText(painted, std::to_string(symbol.code_), center + cv::Point2f(radius, 0), cv::FONT_HERSHEY_COMPLEX,
                    0.4, cv::Scalar(0, 255, 0));
    }
    return painted;
}

void debug::save_symbols(const cv::Mat &image, const std::vector<Symbol> &symbols, const std::filesystem::path &name,
                         const std::filesystem::path &output_path)
{
    const cv::Mat3b painted = paint_symbols(image, symbols);
    if (output_path.empty())
    {
        io::debug::save_image(painted, name, kMarkersSubdir);
    }
    else
    {
        io::debug::save_image_to(painted, name, output_path / kMarkersSubdir);
    }
}
}  // namespace marker
