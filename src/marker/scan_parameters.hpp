#pragma once

namespace marker
{
/**
 * @brief Tunables of the scan. Defaults are the empirical values printed markers were tuned against, changing them
 * changes which markers get recognized.
 */
struct ScanParameters
{
    int max_code_diameter_ = 640;

    // Wellner threshold
    int window_size_ = 30;
    int initial_sum_ = 128;
    float threshold_bias_ = 0.975f;  // borderline pixels lean to black

    // bullseye run test, in pixels
    int min_ring_width_ = 2;

    // unit estimation walks at most this far from the center
    int max_unit_estimate_distance_ = 100;

    // search grid: unit * (1 + k * unit_step_scale_) for k in [-unit_steps_, unit_steps_], arc_steps_ offsets per sector
    int unit_steps_ = 2;
    float unit_step_scale_ = 0.05f;
    int arc_steps_ = 10;

    // fraction of a sector subtracted from the winning arc offset
    float orientation_bias_ = 0.65f;

    ScanParameters() = default;
    explicit ScanParameters(const int max_code_diameter);

    /**
     * @brief Largest expected marker diameter in pixels. Lower values reject more false positives and speed up the
     * scan, too low values hide real markers.
     */
    void set_max_code_diameter(const int diameter);

    /**
     * @brief Upper bound of a single ring width, ceil(diameter / 8).
     */
    int max_unit() const;

    /**
     * @throws std::invalid_argument if a value the scan divides by or loops over is not positive
     */
    void validate() const;
};
}  // namespace marker
