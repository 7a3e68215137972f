/**
 * test_decoder.cpp - 3x3 sampling, ray probes, unit estimation and full decode of rendered symbols
 */
#include <cassert>
#include <cmath>
#include <numbers>
#include <iostream>

#include <marker/code.hpp>
#include <marker/decoder.hpp>
#include <marker/sampling.hpp>
#include <marker/thresholds.hpp>

#include "render.hpp"

namespace
{
// ring width estimate against the rendered width, 5.25 px is read for a 5 px ring
constexpr float kUnitTolerance = 0.05f;
constexpr float kRoundingSlack = 1e-3f;

marker::Raster thresholded(const cv::Mat1b &image)
{
    marker::Raster raster(image);
    thresholds::adaptive_threshold(raster, marker::ScanParameters());
    return raster;
}

void test_small_window_samples()
{
    const marker::Raster raster = thresholded(test::single_symbol_image(120, 120, 31, 60.0, 60.0, 8.0, 0.0));

    assert(marker::sampling::bw_3x3(raster, 60, 60) == 1);
    assert(marker::sampling::bw_3x3(raster, 72, 60) == 0);
    assert(marker::sampling::sample_3x3(raster, 60, 60) == 255);
    assert(marker::sampling::sample_3x3(raster, 72, 60) == 0);
    // left column of the window is still inside the white center
    assert(marker::sampling::sample_3x3(raster, 68, 60) == 85);

    assert(marker::sampling::bw_3x3(raster, 0, 5) == marker::sampling::kOutOfBounds);
    assert(marker::sampling::bw_3x3(raster, 119, 5) == marker::sampling::kOutOfBounds);
    assert(marker::sampling::sample_3x3(raster, 5, 119) == marker::sampling::kOutOfBounds);
    assert(marker::sampling::bw_3x3(raster, 1, 1) == 1);
    std::cout << "[PASS] 3x3 samples and border sentinel" << std::endl;
}

void test_ray_distance()
{
    using marker::sampling::Axis;
    const marker::Raster raster = thresholded(test::single_symbol_image(120, 120, 31, 60.0, 60.0, 8.0, 0.0));

    assert(marker::sampling::ray_distance(raster, 60, 60, Axis::HORIZONTAL, 1) == 8);
    assert(marker::sampling::ray_distance(raster, 60, 60, Axis::HORIZONTAL, -1) == 8);
    assert(marker::sampling::ray_distance(raster, 60, 60, Axis::VERTICAL, 1) == 8);
    assert(marker::sampling::ray_distance(raster, 60, 60, Axis::VERTICAL, -1) == 8);

    // plain white row never flips
    assert(marker::sampling::ray_distance(raster, 5, 5, Axis::HORIZONTAL, 1) == -1);
    std::cout << "[PASS] ray distance to the first color flip" << std::endl;
}

void test_center_and_unit()
{
    const marker::Raster raster = thresholded(test::single_symbol_image(120, 120, 31, 60.0, 60.0, 8.0, 0.0));

    const Eigen::Vector2f center = marker::decoder::refine_center(raster, 62, 59);
    assert(std::abs(center.x() - 60.0f) < 0.5f);
    assert(std::abs(center.y() - 60.0f) < 0.5f);

    const float unit = marker::decoder::read_unit(raster, Eigen::Vector2f(60.0f, 60.0f), 100);
    assert(std::abs(unit - 8.0f) < 0.5f);

    // walk limit shorter than the ring
    assert(marker::decoder::read_unit(raster, Eigen::Vector2f(60.0f, 60.0f), 10) < 0.0f);
    std::cout << "[PASS] center refinement and unit estimation" << std::endl;
}

void test_read_code()
{
    const marker::Raster raster = thresholded(test::single_symbol_image(120, 120, 31, 60.0, 60.0, 8.0, 0.0));

    const auto reading = marker::decoder::read_code(raster, Eigen::Vector2f(60.0f, 60.0f), 8.0f, code::kArc * 0.5f);
    assert(reading.confidence_ > 0);
    assert(reading.bits_ == 31);

    // sampling with a unit far off breaks the ring structure
    const auto broken = marker::decoder::read_code(raster, Eigen::Vector2f(60.0f, 60.0f), 4.0f, code::kArc * 0.5f);
    assert(broken.confidence_ == 0);
    std::cout << "[PASS] sector reading in the middle of the sectors" << std::endl;
}

void test_boundary_seed()
{
    const marker::Raster raster = thresholded(test::single_symbol_image(120, 120, 31, 60.0, 60.0, 8.0, 0.0));

    assert(!marker::decoder::decode(raster, 1, 1, marker::ScanParameters()).has_value());
    assert(!marker::decoder::decode(raster, 118, 60, marker::ScanParameters()).has_value());
    assert(!marker::decoder::decode(raster, 5, 5, marker::ScanParameters()).has_value());
    std::cout << "[PASS] seeds at the border or outside symbols are not decoded" << std::endl;
}

void test_round_trip_all_codes()
{
    const auto codes = test::canonical_codes();
    const marker::ScanParameters parameters;

    // sampling sits in the middle of a sector, half a sector past its start
    const double expected_shift = (parameters.orientation_bias_ - 0.5) * code::kArc;

    const double arc_step = code::kArc / parameters.arc_steps_;
    const float unit_grid = parameters.unit_steps_ * parameters.unit_step_scale_;

    for (size_t idx = 0; idx < codes.size(); ++idx)
    {
        const double orientation = std::fmod(idx * 0.37, 2 * std::numbers::pi);
        const marker::Raster raster =
            thresholded(test::single_symbol_image(120, 120, codes[idx], 60.0, 58.0, 8.0, orientation));

        const auto symbol = marker::decoder::decode(raster, 60, 58, parameters);
        assert(symbol.has_value());
        assert(symbol->is_valid());
        assert(symbol->code_ == codes[idx]);
        assert(std::abs(symbol->center_.x() - 60.0f) <= 1.0f);
        assert(std::abs(symbol->center_.y() - 58.0f) <= 1.0f);

        // the ring width estimate is within 5 %, the search may then settle anywhere on its unit grid
        const float estimate =
            marker::decoder::read_unit(raster, symbol->center_, parameters.max_unit_estimate_distance_);
        assert(std::abs(estimate / 8.0f - 1.0f) <= kUnitTolerance + kRoundingSlack);
        assert(std::abs(symbol->unit_ / estimate - 1.0f) <= unit_grid + kRoundingSlack);

        assert(std::abs(test::angle_difference(symbol->orientation_, orientation - expected_shift)) <= arc_step);
    }
    std::cout << "[PASS] all " << codes.size() << " canonical codes decode back" << std::endl;
}

void test_round_trip_sizes()
{
    struct Case
    {
        double unit_, col_, row_;
    };
    const Case cases[] = {{5.0, 45.5, 44.5}, {6.0, 50.3, 49.6}, {7.0, 55.0, 55.0}, {10.0, 70.2, 71.7}};

    marker::ScanParameters parameters;
    parameters.orientation_bias_ = 0.5f;
    const double arc_step = code::kArc / parameters.arc_steps_;
    const float unit_grid = parameters.unit_steps_ * parameters.unit_step_scale_;

    for (const auto &size : cases)
    {
        const int extent = int(size.col_ * 2) + 1;
        const double orientation = 2.0;
        const marker::Raster raster =
            thresholded(test::single_symbol_image(extent, extent, 203, size.col_, size.row_, size.unit_, orientation));

        const auto symbol =
            marker::decoder::decode(raster, int(std::lround(size.col_)), int(std::lround(size.row_)), parameters);
        assert(symbol.has_value());
        assert(symbol->code_ == 203);
        assert(std::hypot(symbol->center_.x() - size.col_, symbol->center_.y() - size.row_) <= 1.0);

        const float estimate =
            marker::decoder::read_unit(raster, symbol->center_, parameters.max_unit_estimate_distance_);
        assert(std::abs(estimate / size.unit_ - 1.0) <= kUnitTolerance + kRoundingSlack);
        assert(std::abs(symbol->unit_ / estimate - 1.0f) <= unit_grid + kRoundingSlack);

        assert(std::abs(test::angle_difference(symbol->orientation_, orientation)) <= arc_step);
    }
    std::cout << "[PASS] symbols of several sizes, orientation without bias matches the sector start" << std::endl;
}
}  // namespace

int main()
{
    std::cout << "decoder tests" << std::endl;

    test_small_window_samples();
    test_ray_distance();
    test_center_and_unit();
    test_read_code();
    test_boundary_seed();
    test_round_trip_all_codes();
    test_round_trip_sizes();

    std::cout << std::endl << "All tests passed!" << std::endl;
    return 0;
}
