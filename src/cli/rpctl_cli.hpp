#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>

// Parsed command line for one sub-command
struct CliArgs {
    std::filesystem::path config_path;
    bool ignore_disk_usage = false;
    std::filesystem::path output_file;
};

class RpctlCLI {
public:
    RpctlCLI();

    using CommandHandler = std::function<int(RpctlCLI&, const CliArgs&)>;

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& help);

    // Dispatch argv[1..]. Returns the process exit code.
    int execute(const std::vector<std::string>& argv);

    void print_usage() const;

    int run_local(const CliArgs& args);
    int run_transfer(const CliArgs& args);
    int run_status(const CliArgs& args);

    std::optional<Config> config;

private:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;

    bool require_config(const CliArgs& args);
    static bool parse_args(const std::vector<std::string>& argv, size_t start,
                           CliArgs& out, std::string& error);
};

// Exit code for a failed cycle: locked -> 2, anything else -> 1.
int exit_code_for(ErrorKind kind);
