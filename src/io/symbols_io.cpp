#include "symbols_io.hpp"

#include <format>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace symbol_json
{
constexpr std::string_view kCode = "code";
constexpr std::string_view kX = "x";
constexpr std::string_view kY = "y";
constexpr std::string_view kUnit = "unit";
constexpr std::string_view kDiameter = "diameter";
constexpr std::string_view kOrientation = "orientation";
}  // namespace symbol_json

namespace scan_json
{
constexpr std::string_view kCols = "cols";
constexpr std::string_view kRows = "rows";
constexpr std::string_view kCandidateCount = "candidate_count";
constexpr std::string_view kTestedCount = "tested_count";
constexpr std::string_view kDecodedCount = "decoded_count";
constexpr std::string_view kSymbols = "symbols";
}  // namespace scan_json

namespace
{
constexpr int kJsonIndent = 2;
}

nlohmann::json io::to_json(const marker::Symbol& symbol)
{
    nlohmann::json json;
    json[symbol_json::kCode.data()] = symbol.code_;
    json[symbol_json::kX.data()] = symbol.center_.x();
    json[symbol_json::kY.data()] = symbol.center_.y();
    json[symbol_json::kUnit.data()] = symbol.unit_;
    json[symbol_json::kDiameter.data()] = symbol.diameter();
    json[symbol_json::kOrientation.data()] = symbol.orientation_;
    return json;
}

nlohmann::json io::to_json(const marker::detection::ScanResult& result)
{
    nlohmann::json json;
    json[scan_json::kCols.data()] = result.cols_;
    json[scan_json::kRows.data()] = result.rows_;
    json[scan_json::kCandidateCount.data()] = result.candidate_count_;
    json[scan_json::kTestedCount.data()] = result.tested_count_;
    json[scan_json::kDecodedCount.data()] = result.decoded_count_;
    json[scan_json::kSymbols.data()] = nlohmann::json::array();

    for (const auto& symbol : result.symbols_)
    {
        json[scan_json::kSymbols.data()].push_back(to_json(symbol));
    }
    return json;
}

std::filesystem::path io::save_symbols(const marker::detection::ScanResult& result, const std::string& name,
                                       const std::filesystem::path& output_dir)
{
    std::filesystem::create_directories(output_dir);

    const std::filesystem::path json_path = output_dir / std::format("symbols_{}.json", name);
    std::ofstream ofs(json_path);
    if (!ofs.is_open())
    {
        spdlog::error("Failed to open {} for writing", json_path.string());
        throw std::runtime_error(std::format("Cannot write {}", json_path.string()));
    }

    ofs << to_json(result).dump(kJsonIndent);
    spdlog::debug("Saved {} symbols to {}", result.symbols_.size(), json_path.string());
    return json_path;
}
