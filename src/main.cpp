#include <iostream>
#include <vector>
#include <string>
#include "cli/shutterbox_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        ShutterboxCLI cli;
        std::vector<std::string> args(argv + 1, argv + argc);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
