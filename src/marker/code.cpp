#include "code.hpp"

#include <bit>

bool code::is_checksum_valid(const int bits)
{
    if (bits < 0 || bits > kCodeMask)
    {
        return false;
    }
    return std::popcount(static_cast<unsigned>(bits)) == kChecksumBits;
}

int code::rotate_left(const int bits) { return ((bits << 1) & kCodeMask) | ((bits & kCodeMask) >> (kSectors - 1)); }

code::Rotation code::canonical_rotation(const int bits)
{
    Rotation lowest{bits & kCodeMask, 0};

    int rotated = lowest.code_;
    for (int step = 1; step < kSectors; ++step)
    {
        rotated = rotate_left(rotated);
        if (rotated < lowest.code_)
        {
            lowest = {rotated, step};
        }
    }
    return lowest;
}

float code::orientation(const int steps, const float arc_offset, const float bias)
{
    return -steps * kArc + arc_offset - kArc * bias;
}
