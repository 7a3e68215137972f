#include "subcommand.hpp"

#include <spdlog/spdlog.h>

namespace utils
{
CLI::App& Subcommand::set_subcommand(CLI::App& app)
{
    CLI::App* subcommand = app.add_subcommand(name(), description());
    set_options(*subcommand);
    subcommand->callback(
        [this]()
        {
            spdlog::info("Launching {}", name());
            execute();
        });
    return *subcommand;
}

CLI::Option* Subcommand::add_images_path(CLI::App& cmd, std::filesystem::path& images_path)
{
    return cmd.add_option("-i, --images", images_path, "Image file or directory with images")->check(CLI::ExistingPath);
}

CLI::Option* Subcommand::add_path_to_save(CLI::App& cmd, std::filesystem::path& output_folder)
{
    return cmd.add_option("-o, --output-dir", output_folder, "Path to save directory");
}

CLI::Option* Subcommand::add_device(CLI::App& cmd, int& device_id)
{
    return cmd.add_option("-d, --device", device_id, "Index of a capture device");
}

CLI::Option* Subcommand::add_max_diameter(CLI::App& cmd, int& max_diameter)
{
    return cmd.add_option("-m, --max-diameter", max_diameter, "Maximal expected code diameter in pixels")
        ->check(CLI::PositiveNumber);
}

CLI::Option* Subcommand::add_params_path(CLI::App& cmd, std::filesystem::path& params_path)
{
    return cmd.add_option("--params-path", params_path, "Path to scan parameters json.")->check(CLI::ExistingFile);
}

}  // namespace utils
