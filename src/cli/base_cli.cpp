#include "base_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

std::string CommandArgs::get(const std::string& name, const std::string& fallback) const {
    auto it = options.find(name);
    return it == options.end() ? fallback : it->second;
}

Result<CommandArgs> parse_command_args(const std::vector<std::string>& args,
                                       const std::set<std::string>& with_value,
                                       const std::set<std::string>& switches) {
    CommandArgs parsed;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a.rfind("--", 0) != 0) {
            parsed.positional.push_back(a);
            continue;
        }
        if (with_value.count(a)) {
            if (i + 1 >= args.size()) {
                return Result<CommandArgs>::Err("Missing value for " + a);
            }
            parsed.options[a] = args[++i];
        } else if (switches.count(a)) {
            parsed.flags.insert(a);
        } else {
            return Result<CommandArgs>::Err("Unknown flag: " + a);
        }
    }
    return Result<CommandArgs>::Ok(parsed);
}

BaseCLI::BaseCLI() : home(default_config_home()) {}

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (config.has_value()) return true;

    auto result = Config::load(home);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    config = result.value;
    return true;
}

void BaseCLI::init_logging(bool verbose_flag) {
    verbose = verbose_flag;
    log_init(home / LOG_DIR_NAME / APP_LOG_NAME, verbose);
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'shutterbox --help' for available commands.");
        return 1;
    }

    for (const auto& a : args) {
        if (a == "--help" || a == "-h") {
            std::cout << theme::info(command + ": " + it->second.second);
            std::cout << theme::step("Run 'shutterbox --help' for the flags of every command.");
            return 0;
        }
    }

    log_info("shutterbox {} ({} args)", command, args.size());
    try {
        return it->second.first(*this, args);
    } catch (const PipelineError& e) {
        log_error("{}: {}", error_kind_name(e.kind()), e.what());
        std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(e.kind()), e.what()));
    } catch (const std::exception& e) {
        log_error("{}", e.what());
        std::cout << theme::fail(std::string(e.what()));
    }
    return 1;
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Pipeline", {"ingest", "upload", "sync"}},
        {"Stores",   {"status", "rehash"}},
        {"Setup",    {"init"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::TEAL << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::AMBER
                          << fmt::format("    {:<10}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}
