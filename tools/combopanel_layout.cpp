#include "cli/LayoutCommand.hpp"

#include <combopanel/config/DebugFlags.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
#ifdef CP_LOG_DEBUG
    CP::set_logging_enabled(CP::Config::ParseTruthy(std::getenv("COMBOPANEL_LOG")));
#endif

    auto options = CP::Cli::ParseLayoutArgs(argc, argv, [](std::string const& message) { std::cerr << message << '\n'; });
    if (!options) {
        std::cerr << CP::Cli::LayoutUsage();
        return EXIT_FAILURE;
    }
    if (options->show_help) {
        std::cout << CP::Cli::LayoutUsage();
        return EXIT_SUCCESS;
    }

    auto output = CP::Cli::RunLayout(*options);
    if (!output) {
        std::cerr << "Layout failed: " << CP::describeError(output.error()) << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << *output << '\n';
    return EXIT_SUCCESS;
}
