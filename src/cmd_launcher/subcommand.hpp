#pragma once

#include <filesystem>
#include <string>

#include <CLI/CLI.hpp>

namespace utils
{
/**
 * @brief One verb of the `topcode` executable. Derived classes declare their options in `set_options` and do the work
 * in `execute`, which CLI11 calls after parsing succeeded.
 */
class Subcommand
{
   public:
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    /**
     * @brief Register as subcommand of `app`, `execute` becomes its callback.
     */
    CLI::App& set_subcommand(CLI::App& app);

    virtual ~Subcommand() = default;

   protected:
    virtual void set_options(CLI::App& cmd) = 0;
    virtual void execute() = 0;

    // options shared between subcommands
    CLI::Option* add_images_path(CLI::App& cmd, std::filesystem::path& images_path);
    CLI::Option* add_path_to_save(CLI::App& cmd, std::filesystem::path& output_folder);
    CLI::Option* add_params_path(CLI::App& cmd, std::filesystem::path& params_path);
    CLI::Option* add_max_diameter(CLI::App& cmd, int& max_diameter);
    CLI::Option* add_device(CLI::App& cmd, int& device_id);
};
}  // namespace utils
