#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    vlanvision::app::CommandLine commandLine;
    try {
        commandLine = vlanvision::app::Application::parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << vlanvision::app::Application::usage(argv[0]);
        return 2;
    }

    if (commandLine.showHelp) {
        std::cout << vlanvision::app::Application::usage(argv[0]);
        return 0;
    }

    try {
        vlanvision::app::Application app(std::move(commandLine));
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
