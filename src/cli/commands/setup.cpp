#include "pipeline_helpers.hpp"
#include "../theme.hpp"
#include <iostream>

static int do_init(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::cout << theme::fail("init takes no arguments");
        return 1;
    }

    auto config_path = get_config_path(cli.home);
    if (config_exists(cli.home)) {
        std::cout << theme::info("Config already exists at " + config_path.string());
        return 0;
    }

    auto result = create_default_config(cli.home);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    std::cout << theme::ok("Created " + config_path.string());
    std::cout << theme::step("Set the server and volume names, then run 'shutterbox status'");
    return 0;
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "Write a default configuration file");
}
