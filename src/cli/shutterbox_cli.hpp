#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

class ShutterboxCLI : public BaseCLI {
public:
    ShutterboxCLI();

    // Parse global flags (--verbose, --home) off the front of argv-style
    // args, then dispatch. Returns the process exit status.
    int run(const std::vector<std::string>& argv);

    void print_usage() const;

private:
    void register_all_commands();
};
