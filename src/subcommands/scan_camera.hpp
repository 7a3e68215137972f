#pragma once

#include <cmd_launcher/subcommand.hpp>

class ScanCamera : public utils::Subcommand
{
   private:
    int device_id_ = 0;
    int frames_ = 100;
    int max_diameter_ = 0;

   public:
    std::string name() const override { return "ScanCamera"; }

    std::string description() const override { return "Find TopCodes in frames of a live capture device"; }

    void set_options(CLI::App& cmd) override
    {
        add_device(cmd, device_id_)->default_val(0);
        add_max_diameter(cmd, max_diameter_);
        cmd.add_option("-f, --frames", frames_, "Number of frames to scan, 0 scans until the device stops.")
            ->default_val(100)
            ->check(CLI::NonNegativeNumber);
    }

    void execute() override;
};
