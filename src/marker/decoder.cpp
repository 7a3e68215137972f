#include "decoder.hpp"

#include <array>
#include <cmath>
#include <cstdlib>

#include "code.hpp"
#include "sampling.hpp"

namespace
{
static constexpr int kMidGrey = 128;
static constexpr int kFullWhite = 0xff;

// sample positions along a sector ray, see read_code
static constexpr std::array<int, 4> kWhiteRings{1, 3, 4, 6};
static constexpr std::array<int, 2> kBlackRings{2, 5};
static constexpr int kDataRing = 7;
static constexpr int kOppositeDataRing = 0;

/**
 * @brief Tracks white -> black -> white transition walking out of the bullseye.
 */
struct EdgeWalk
{
    bool on_white_ = true;
    int distance_ = 0;

    void update(const int sample, const int step)
    {
        if (distance_ > 0)
        {
            return;
        }
        if (on_white_ && sample == 0)
        {
            on_white_ = false;
        }
        else if (!on_white_ && sample == 1)
        {
            distance_ = step;
        }
    }

    bool found() const { return distance_ > 0; }
};

int three_rays(const marker::Raster &raster, const int col, const int row, const marker::sampling::Axis axis,
               const int step)
{
    using marker::sampling::Axis;
    using marker::sampling::ray_distance;

    if (axis == Axis::VERTICAL)
    {
        return ray_distance(raster, col, row, axis, step) + ray_distance(raster, col - 1, row, axis, step) +
               ray_distance(raster, col + 1, row, axis, step);
    }
    return ray_distance(raster, col, row, axis, step) + ray_distance(raster, col, row - 1, axis, step) +
           ray_distance(raster, col, row + 1, axis, step);
}
}  // namespace

namespace marker
{
Eigen::Vector2f decoder::refine_center(const Raster &raster, const int col, const int row)
{
    const int up = three_rays(raster, col, row, sampling::Axis::VERTICAL, -1);
    const int down = three_rays(raster, col, row, sampling::Axis::VERTICAL, 1);
    const int left = three_rays(raster, col, row, sampling::Axis::HORIZONTAL, -1);
    const int right = three_rays(raster, col, row, sampling::Axis::HORIZONTAL, 1);

    return Eigen::Vector2f(col + (right - left) / 6.0f, row + (down - up) / 6.0f);
}

float decoder::read_unit(const Raster &raster, const Eigen::Vector2f &center, const int max_distance)
{
    const int col = int(std::lround(center.x()));
    const int row = int(std::lround(center.y()));

    EdgeWalk left, right, up, down;

    for (int step = 1;; ++step)
    {
        if (col - step < 1 || col + step >= raster.cols() - 1 || row - step < 1 || row + step >= raster.rows() - 1 ||
            step > max_distance)
        {
            return -1.0f;
        }

        left.update(sampling::bw_3x3(raster, col - step, row), step);
        right.update(sampling::bw_3x3(raster, col + step, row), step);
        up.update(sampling::bw_3x3(raster, col, row - step), step);
        down.update(sampling::bw_3x3(raster, col, row + step), step);

        if (left.found() && right.found() && up.found() && down.found())
        {
            const int horizontal = left.distance_ + right.distance_;
            const int vertical = up.distance_ + down.distance_;
            const float unit = (horizontal + vertical) / float(code::kWidthUnits);

            if (std::abs(horizontal - vertical) > unit)
            {
                return -1.0f;
            }
            return unit;
        }
    }
}

decoder::Reading decoder::read_code(const Raster &raster, const Eigen::Vector2f &center, const float unit,
                                    const float arc_offset)
{
    std::array<int, code::kWidthUnits> core;

    int confidence = 0;
    int bits = 0;

    for (int sector = code::kSectors - 1; sector >= 0; --sector)
    {
        const float dx = std::cos(code::kArc * sector + arc_offset);
        const float dy = std::sin(code::kArc * sector + arc_offset);

        for (int idx = 0; idx < code::kWidthUnits; ++idx)
        {
            const float distance = (idx - (code::kWidthUnits - 1) / 2.0f) * unit;
            const int col = int(std::lround(center.x() + dx * distance));
            const int row = int(std::lround(center.y() + dy * distance));

            core[idx] = sampling::sample_3x3(raster, col, row);
            if (core[idx] == sampling::kOutOfBounds)
            {
                return {};
            }
        }

        for (const int ring : kWhiteRings)
        {
            if (core[ring] <= kMidGrey)
            {
                return {};
            }
            confidence += core[ring];
        }
        for (const int ring : kBlackRings)
        {
            if (core[ring] > kMidGrey)
            {
                return {};
            }
            confidence += kFullWhite - core[ring];
        }

        // sharp data ring reading adds, the opposite one is rewarded for sitting on an edge
        confidence += std::abs(core[kDataRing] * 2 - kFullWhite);
        confidence += kFullWhite - std::abs(core[kOppositeDataRing] * 2 - kFullWhite);

        bits = (bits << 1) + (core[kDataRing] > kMidGrey ? 1 : 0);
    }

    if (!code::is_checksum_valid(bits))
    {
        return {};
    }
    return {confidence, bits};
}

std::optional<Symbol> decoder::decode(const Raster &raster, const int col, const int row,
                                      const ScanParameters &parameters)
{
    const Eigen::Vector2f center = refine_center(raster, col, row);

    const float unit = read_unit(raster, center, parameters.max_unit_estimate_distance_);
    if (unit < 0.0f)
    {
        return std::nullopt;
    }

    // keep hypothesis with maximal confidence, first one wins on ties
    Reading best;
    float best_unit = unit;
    float best_arc = 0.0f;

    for (int unit_step = -parameters.unit_steps_; unit_step <= parameters.unit_steps_; ++unit_step)
    {
        const float unit_tried = unit + unit * parameters.unit_step_scale_ * unit_step;
        for (int arc_step = 0; arc_step < parameters.arc_steps_; ++arc_step)
        {
            const float arc_offset = arc_step * code::kArc / parameters.arc_steps_;
            const Reading reading = read_code(raster, center, unit_tried, arc_offset);
            if (reading.confidence_ > best.confidence_)
            {
                best = reading;
                best_unit = unit_tried;
                best_arc = arc_offset;
            }
        }
    }

    if (best.confidence_ <= 0)
    {
        return std::nullopt;
    }

    const code::Rotation rotation = code::canonical_rotation(best.bits_);
    return Symbol(rotation.code_, center, best_unit,
                  code::orientation(rotation.steps_, best_arc, parameters.orientation_bias_));
}
}  // namespace marker
