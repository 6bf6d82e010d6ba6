// Speeds & Feeds Calculator - Main Entry Point

#include <iostream>
#include <string>
#include <vector>

#include "app/cli_app.h"

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = sfc::parseCliArgs(args);
    if (!parsed.ok()) {
        std::cerr << "Error: " << parsed.error << "\n\n" << sfc::cliUsage(argv[0]);
        return 2;
    }
    if (parsed.options.help) {
        std::cout << sfc::cliUsage(argv[0]);
        return 0;
    }

    sfc::CliApp app(std::move(parsed.options));
    if (!app.init()) {
        return 1;
    }
    return app.run();
}
