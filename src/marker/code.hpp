#pragma once

#include <numbers>

/**
 * @brief Bit arithmetic of the 13 sector data ring. A marker value is read most significant sector first, only values
 * with exactly 5 bits set are legal, and the identity of a marker is the smallest of its 13 cyclic rotations.
 */
namespace code
{
static constexpr int kSectors = 13;
static constexpr int kWidthUnits = 8;
static constexpr int kCodeMask = (1 << kSectors) - 1;
static constexpr int kChecksumBits = 5;
static constexpr int kInvalidCode = -1;

// span of a single sector in radians
static constexpr float kArc = 2.0f * std::numbers::pi_v<float> / kSectors;

struct Rotation
{
    int code_;
    int steps_;  // left rotations applied to reach code_
};

bool is_checksum_valid(const int bits);

int rotate_left(const int bits);

/**
 * @brief Smallest value among the 13 cyclic left rotations of bits. On ties the smallest rotation count is kept.
 */
Rotation canonical_rotation(const int bits);

/**
 * @brief Physical rotation of a marker whose reading needed `steps` left rotations, taken with `arc_offset` radians of
 * sampling offset.
 *
 * @param bias fraction of a sector subtracted from the offset, the search lands systematically past the sector center
 */
float orientation(const int steps, const float arc_offset, const float bias);
}  // namespace code
