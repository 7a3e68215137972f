/**
 * test_scan_parameters.cpp - scan tunables and their json loader
 */
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <io/scan_parameters_io.hpp>
#include <marker/scan_parameters.hpp>

namespace
{
void test_max_unit()
{
    marker::ScanParameters parameters;
    assert(parameters.max_code_diameter_ == 640);
    assert(parameters.max_unit() == 80);

    parameters.set_max_code_diameter(50);
    assert(parameters.max_unit() == 7);
    assert(marker::ScanParameters(40).max_unit() == 5);

    bool thrown = false;
    try
    {
        parameters.set_max_code_diameter(0);
    }
    catch (const std::invalid_argument &)
    {
        thrown = true;
    }
    assert(thrown);
    assert(parameters.max_code_diameter_ == 50);
    std::cout << "[PASS] max unit follows max diameter" << std::endl;
}

bool rejected(const marker::ScanParameters &parameters)
{
    try
    {
        parameters.validate();
    }
    catch (const std::invalid_argument &)
    {
        return true;
    }
    return false;
}

void test_validate()
{
    assert(!rejected(marker::ScanParameters()));

    marker::ScanParameters no_window;
    no_window.window_size_ = 0;
    assert(rejected(no_window));

    marker::ScanParameters no_arcs;
    no_arcs.arc_steps_ = -1;
    assert(rejected(no_arcs));

    marker::ScanParameters no_walk;
    no_walk.max_unit_estimate_distance_ = 0;
    assert(rejected(no_walk));

    marker::ScanParameters no_diameter;
    no_diameter.max_code_diameter_ = 0;
    assert(rejected(no_diameter));
    std::cout << "[PASS] validation rejects non positive window, arc steps, walk and diameter" << std::endl;
}

void test_read_partial_file()
{
    const auto path = std::filesystem::temp_directory_path() / "topcode_test_params.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"max_code_diameter": 100, "arc_steps": 20, "orientation_bias": 0.5})";
    }

    const marker::ScanParameters parameters = io::read_scan_parameters(path);
    assert(parameters.max_code_diameter_ == 100);
    assert(parameters.max_unit() == 13);
    assert(parameters.arc_steps_ == 20);
    assert(parameters.orientation_bias_ == 0.5f);
    // untouched keys keep defaults
    assert(parameters.window_size_ == 30);
    assert(parameters.threshold_bias_ == 0.975f);
    assert(parameters.unit_steps_ == 2);

    std::filesystem::remove(path);
    std::cout << "[PASS] partial parameter file overrides only its keys" << std::endl;
}

void test_read_invalid()
{
    bool thrown = false;
    try
    {
        io::read_scan_parameters(std::filesystem::temp_directory_path() / "topcode_missing_params.json");
    }
    catch (const std::invalid_argument &)
    {
        thrown = true;
    }
    assert(thrown);

    const auto path = std::filesystem::temp_directory_path() / "topcode_test_bad_params.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"window_size": 0})";
    }
    thrown = false;
    try
    {
        io::read_scan_parameters(path);
    }
    catch (const std::invalid_argument &)
    {
        thrown = true;
    }
    assert(thrown);
    for (const char *const content : {R"({"max_code_diameter": )", R"({"arc_steps": "ten"})"})
    {
        {
            std::ofstream ofs(path);
            ofs << content;
        }
        thrown = false;
        try
        {
            io::read_scan_parameters(path);
        }
        catch (const std::invalid_argument &)
        {
            thrown = true;
        }
        assert(thrown);
    }

    std::filesystem::remove(path);
    std::cout << "[PASS] missing file, malformed json and non positive values are rejected" << std::endl;
}
}  // namespace

int main()
{
    std::cout << "scan parameters tests" << std::endl;

    test_max_unit();
    test_validate();
    test_read_partial_file();
    test_read_invalid();

    std::cout << std::endl << "All tests passed!" << std::endl;
    return 0;
}
