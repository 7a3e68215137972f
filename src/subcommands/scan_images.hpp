#pragma once

#include <filesystem>

#include <cmd_launcher/subcommand.hpp>

class ScanImages : public utils::Subcommand
{
   private:
    std::filesystem::path images_path_;
    std::filesystem::path output_folder_;
    std::filesystem::path params_path_;
    int max_diameter_ = 0;

   public:
    std::string name() const override { return "Scan"; }

    std::string description() const override { return "Find TopCodes in image files"; }

    void set_options(CLI::App& cmd) override
    {
        add_images_path(cmd, images_path_)->required();
        add_path_to_save(cmd, output_folder_);
        add_max_diameter(cmd, max_diameter_);
        add_params_path(cmd, params_path_);
    }

    void execute() override;
};
