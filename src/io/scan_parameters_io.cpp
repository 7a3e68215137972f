#include "scan_parameters_io.hpp"

#include <format>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace params
{
constexpr std::string_view kMaxCodeDiameter = "max_code_diameter";
constexpr std::string_view kWindowSize = "window_size";
constexpr std::string_view kInitialSum = "initial_sum";
constexpr std::string_view kThresholdBias = "threshold_bias";
constexpr std::string_view kMinRingWidth = "min_ring_width";
constexpr std::string_view kMaxUnitEstimateDistance = "max_unit_estimate_distance";
constexpr std::string_view kUnitSteps = "unit_steps";
constexpr std::string_view kUnitStepScale = "unit_step_scale";
constexpr std::string_view kArcSteps = "arc_steps";
constexpr std::string_view kOrientationBias = "orientation_bias";
}  // namespace params

namespace
{
template <typename T>
void read_if_present(const nlohmann::json& json, const std::string_view key, T& value)
{
    if (json.contains(key.data()))
    {
        value = json[key.data()].get<T>();
    }
}

void read_values(const nlohmann::json& json, marker::ScanParameters& parameters)
{
    int max_code_diameter = parameters.max_code_diameter_;
    read_if_present(json, params::kMaxCodeDiameter, max_code_diameter);
    parameters.set_max_code_diameter(max_code_diameter);

    read_if_present(json, params::kWindowSize, parameters.window_size_);
    read_if_present(json, params::kInitialSum, parameters.initial_sum_);
    read_if_present(json, params::kThresholdBias, parameters.threshold_bias_);
    read_if_present(json, params::kMinRingWidth, parameters.min_ring_width_);
    read_if_present(json, params::kMaxUnitEstimateDistance, parameters.max_unit_estimate_distance_);
    read_if_present(json, params::kUnitSteps, parameters.unit_steps_);
    read_if_present(json, params::kUnitStepScale, parameters.unit_step_scale_);
    read_if_present(json, params::kArcSteps, parameters.arc_steps_);
    read_if_present(json, params::kOrientationBias, parameters.orientation_bias_);
}
}  // namespace

marker::ScanParameters io::read_scan_parameters(const std::filesystem::path& filepath)
{
    if (!std::filesystem::exists(filepath))
    {
        throw std::invalid_argument(std::format("Error loading '{}'. File does not exist.", filepath.string()));
    }

    std::ifstream file(filepath);
    nlohmann::json json;
    marker::ScanParameters parameters;

    try
    {
        file >> json;
        read_values(json, parameters);
    }
    catch (const nlohmann::json::exception& e)
    {
        spdlog::error("Malformed scan parameters in {}: {}", filepath.string(), e.what());
        throw std::invalid_argument(std::format("Error loading '{}': {}", filepath.string(), e.what()));
    }
    parameters.validate();

    spdlog::info("scan parameters from {}: max diameter {}, window {}, bias {}", filepath.string(),
                 parameters.max_code_diameter_, parameters.window_size_, parameters.threshold_bias_);
    return parameters;
}
