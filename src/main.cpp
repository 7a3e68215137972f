#include <cmd_launcher/cmd_launcher.hpp>

#include "subcommands/scan_camera.hpp"
#include "subcommands/scan_images.hpp"

static constexpr std::string_view kAbout = "TopCode fiducial marker scanner";

int main(int argc, char* argv[])
{
    utils::CmdLauncher<ScanImages, ScanCamera> launcher(kAbout);
    return launcher.launch(argc, argv);
}
