#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <functional>
#include <optional>
#include <filesystem>
#include <core/config.hpp>

// Options of one command line: "--name value" pairs, bare "--flag"s and
// everything else in order.
struct CommandArgs {
    std::map<std::string, std::string> options;
    std::set<std::string> flags;
    std::vector<std::string> positional;

    bool has(const std::string& flag) const { return flags.count(flag) > 0; }
    std::string get(const std::string& name, const std::string& fallback = "") const;
};

// Split args for a command. Names in `with_value` consume the next argument;
// any other "--name" must be listed in `switches`.
Result<CommandArgs> parse_command_args(const std::vector<std::string>& args,
                                       const std::set<std::string>& with_value,
                                       const std::set<std::string>& switches);

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    // Returns the process exit status.
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);

    // Load <home>/config.yaml into `config`. Prints the problem and returns
    // false if there is none or it does not parse.
    bool require_config();

    // Route the app log to <home>/logs and remember the verbosity.
    void init_logging(bool verbose);

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    // Public state
    std::filesystem::path home;
    bool verbose = false;
    std::optional<Config> config;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
