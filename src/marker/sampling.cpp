#include "sampling.hpp"

namespace
{
bool window_fits(const marker::Raster &raster, const int col, const int row)
{
    return raster.inside(col - 1, row - 1) && raster.inside(col + 1, row + 1);
}

int white_in_small_window(const marker::Raster &raster, const int col, const int row)
{
    int white = 0;
    for (int row_iter = row - 1; row_iter <= row + 1; ++row_iter)
    {
        for (int col_iter = col - 1; col_iter <= col + 1; ++col_iter)
        {
            white += raster.binary_(row_iter, col_iter);
        }
    }
    return white;
}
}  // namespace

namespace marker
{
int sampling::bw_3x3(const Raster &raster, const int col, const int row)
{
    if (!window_fits(raster, col, row))
    {
        return kOutOfBounds;
    }
    return white_in_small_window(raster, col, row) >= 5 ? 1 : 0;
}

int sampling::sample_3x3(const Raster &raster, const int col, const int row)
{
    if (!window_fits(raster, col, row))
    {
        return kOutOfBounds;
    }
    return white_in_small_window(raster, col, row) * 255 / 9;
}

int sampling::ray_distance(const Raster &raster, const int col, const int row, const Axis axis, const int step)
{
    const int start = bw_3x3(raster, col, row);
    if (start == kOutOfBounds)
    {
        return -1;
    }

    const int origin = axis == Axis::HORIZONTAL ? col : row;
    const int size = axis == Axis::HORIZONTAL ? raster.cols() : raster.rows();

    for (int position = origin + step; position > 1 && position < size - 1; position += step)
    {
        const int sample =
            axis == Axis::HORIZONTAL ? bw_3x3(raster, position, row) : bw_3x3(raster, col, position);
        if (sample == kOutOfBounds)
        {
            return -1;
        }
        if (sample != start)
        {
            return step > 0 ? position - origin : origin - position;
        }
    }
    return -1;
}
}  // namespace marker
