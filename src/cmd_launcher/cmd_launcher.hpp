#pragma once

#include <concepts>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <tuple>

#include <CLI/CLI.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "subcommand.hpp"

namespace utils
{
/**
 * @brief Owns the CLI application and one instance of every subcommand. Exactly one subcommand has to be given.
 */
template <std::derived_from<Subcommand>... Subcommands>
class CmdLauncher
{
    CLI::App app_;
    std::tuple<Subcommands...> subcommands_;

   public:
    explicit CmdLauncher(const std::string_view& about) : app_{std::string(about)}
    {
        spdlog::cfg::load_env_levels();

        std::apply([this](auto&&... args) { (args.set_subcommand(app_), ...); }, subcommands_);

        app_.require_subcommand(1);
    }

    /**
     * @returns process exit code, parse errors are reported by CLI11, failures of the subcommand are logged
     */
    int launch(const int argc, const char* const* const argv)
    {
        try
        {
            app_.parse(argc, argv);
        }
        catch (const CLI::ParseError& e)
        {
            return app_.exit(e);
        }
        catch (const std::exception& e)
        {
            spdlog::error("{} failed: {}", argv[0], e.what());
            return EXIT_FAILURE;
        }

        spdlog::info("{} finished", argv[0]);
        return EXIT_SUCCESS;
    }
};

}  // namespace utils
