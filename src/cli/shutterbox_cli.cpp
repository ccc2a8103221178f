#include "shutterbox_cli.hpp"
#include "theme.hpp"
#include "commands/pipeline_helpers.hpp"
#include <core/constants.hpp>
#include <iostream>

ShutterboxCLI::ShutterboxCLI() : BaseCLI() {
    register_all_commands();
}

void ShutterboxCLI::register_all_commands() {
    register_setup_commands(*this);
    register_ingest_commands(*this);
    register_upload_commands(*this);
    register_status_commands(*this);
    register_sync_commands(*this);
}

void ShutterboxCLI::print_usage() const {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::AMBER << "    shutterbox "
              << theme::color::RESET << theme::color::DIM << "[--verbose] [--home <dir>] "
              << theme::color::RESET << "<command> [flags]\n";
    print_help();
    std::cout << theme::color::DIM
              << "    ingest  [--source <vol>] [--archive <vol>] [--dry-run] [--ignore-space] [--rebuild-if-empty]\n"
              << "    upload  [--archive <vol>] [--all | --date YYYY/MM/DD | --retry-failed | --force] [--dry-run]\n"
              << "    rehash  [--archive <vol>]\n"
              << "    sync    [--from <vol>] [--to <vol>] [--dry-run]\n"
              << "    status  [--validate]\n\n"
              << "    shutterbox --version        Show version\n"
              << "    shutterbox --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int ShutterboxCLI::run(const std::vector<std::string>& argv) {
    bool verbose_flag = false;
    size_t i = 0;

    for (; i < argv.size(); i++) {
        const std::string& a = argv[i];
        if (a == "--verbose" || a == "-v") {
            verbose_flag = true;
        } else if (a == "--home") {
            if (i + 1 >= argv.size()) {
                std::cout << theme::fail("Missing value for --home");
                return 1;
            }
            home = argv[++i];
        } else if (a == "--version") {
            std::cout << theme::color::AMBER << theme::color::BOLD << "shutterbox"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << APP_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (a == "--help" || a == "-h" || a == "help") {
            print_usage();
            return 0;
        } else {
            break;
        }
    }

    if (i >= argv.size()) {
        print_usage();
        return 1;
    }

    init_logging(verbose_flag);

    std::string command = argv[i];
    std::vector<std::string> args(argv.begin() + static_cast<long>(i) + 1, argv.end());
    return execute_command(command, args);
}
