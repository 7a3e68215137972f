#include "thresholds.hpp"

#include <cstdlib>
#include <string_view>

#include <spdlog/spdlog.h>

#include <io/debug.hpp>

#include "debugging.hpp"

namespace
{
static constexpr std::string_view kThresholdsSubdir = "thresholds";

// every accepted bullseye marks three pixels
static constexpr int kMarkedPerBullseye = 3;

void mark_candidates(marker::Raster &raster, const thresholds::RowTraversal &traversal, const int col,
                     const thresholds::RunState &run)
{
    const int middle = traversal.behind(col, 1 + run.b2_ + run.w1_ / 2);
    for (int mark = middle - 1; mark <= middle + 1; ++mark)
    {
        if (mark >= 0 && mark < raster.cols())
        {
            raster.candidates_(traversal.row_, mark) = 1;
        }
    }
}

/**
 * @brief Advance run state with a single binarized pixel.
 *
 * @returns true if the pixel closed a bullseye pattern
 */
bool advance(thresholds::RunState &run, const bool white, const int max_unit, const int min_ring_width)
{
    using Level = thresholds::RunState::Level;

    switch (run.level_)
    {
        case Level::WHITE:
        {
            if (!white)
            {
                run.level_ = Level::FIRST_BLACK;
                run.b1_ = 1;
                run.w1_ = 0;
                run.b2_ = 0;
            }
            return false;
        }
        case Level::FIRST_BLACK:
        {
            if (!white)
            {
                ++run.b1_;
            }
            else
            {
                run.level_ = Level::MIDDLE_WHITE;
                run.w1_ = 1;
            }
            return false;
        }
        case Level::MIDDLE_WHITE:
        {
            if (!white)
            {
                run.level_ = Level::SECOND_BLACK;
                run.b2_ = 1;
            }
            else
            {
                ++run.w1_;
            }
            return false;
        }
        case Level::SECOND_BLACK:
        default:
        {
            if (!white)
            {
                ++run.b2_;
                return false;
            }
            return thresholds::is_bullseye(run.b1_, run.w1_, run.b2_, max_unit, min_ring_width);
        }
    }
}

void restart_after_second_black(thresholds::RunState &run)
{
    // second black run becomes the first one of the next candidate, current pixel starts its white run
    run.b1_ = run.b2_;
    run.w1_ = 1;
    run.b2_ = 0;
    run.level_ = thresholds::RunState::Level::MIDDLE_WHITE;
}
}  // namespace

namespace thresholds
{
RowTraversal::RowTraversal(const int row, const int cols)
    : row_(row), cols_(cols), direction_(row % 2 == 0 ? ScanDirection::LEFT_TO_RIGHT : ScanDirection::RIGHT_TO_LEFT)
{
}

bool is_bullseye(const int b1, const int w1, const int b2, const int max_unit, const int min_ring_width)
{
    if (b1 < min_ring_width || b2 < min_ring_width)
    {
        return false;
    }
    if (b1 > max_unit || b2 > max_unit || w1 > max_unit + max_unit)
    {
        return false;
    }

    const int center_mismatch = std::abs(b1 + b2 - w1);
    if (center_mismatch > b1 + b2 || center_mismatch > w1)
    {
        return false;
    }

    const int ring_mismatch = std::abs(b1 - b2);
    return ring_mismatch <= b1 && ring_mismatch <= b2;
}

int adaptive_threshold(marker::Raster &raster, const marker::ScanParameters &parameters)
{
    const int window = parameters.window_size_;
    const int max_unit = parameters.max_unit();

    int candidates = 0;
    int sum = parameters.initial_sum_;

    for (int row = 0; row < raster.rows(); ++row)
    {
        const RowTraversal traversal(row, raster.cols());
        RunState run;

        for (int step = 0; step < raster.cols(); ++step)
        {
            const int col = traversal.col(step);
            const int intensity = raster.intensity_(row, col);

            // approximate sum of the last `window` pixels along the scan path
            sum += intensity - sum / window;

            const int threshold =
                row > 0 ? (sum + raster.intensity_(row - 1, col)) / (2 * window) : sum / window;

            const bool white = !(intensity < threshold * parameters.threshold_bias_);

            raster.binary_(row, col) = white ? 1 : 0;
            raster.intensity_(row, col) = sum;

            const bool closes_second_black = run.level_ == RunState::Level::SECOND_BLACK && white;
            if (advance(run, white, max_unit, parameters.min_ring_width_))
            {
                mark_candidates(raster, traversal, col, run);
                candidates += kMarkedPerBullseye;
            }
            if (closes_second_black)
            {
                restart_after_second_black(run);
            }
        }
    }

    spdlog::debug("adaptive threshold of {}x{} image marked {} candidate pixels", raster.cols(), raster.rows(),
                  candidates);

    if constexpr (kShowThresholds)
    {
        io::debug::save_image(raster.preview(), "binarized", kThresholdsSubdir);
    }

    return candidates;
}

}  // namespace thresholds
