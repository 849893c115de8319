#include "config.hpp"
#include "size_units.hpp"
#include "utils.hpp"
#include "constants.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// Sizes accept either a bare byte count or a human-readable string.
// Missing keys come back as -1 so validation can tell "absent" from "zero".
static int64_t parse_size_node(const YAML::Node& node, const std::string& key,
                               const std::string& section,
                               std::vector<std::string>& errors) {
    if (!node[key]) return -1;
    std::string text = node[key].as<std::string>("");
    auto bytes = parse_size(text);
    if (!bytes) {
        errors.push_back(fmt::format("{}.{}: cannot parse size '{}'", section, key, text));
        return -1;
    }
    return *bytes;
}

static double parse_ratio_node(const YAML::Node& node, const std::string& key,
                               const std::string& section,
                               std::vector<std::string>& errors) {
    if (!node[key]) return 0.0;
    try {
        return node[key].as<double>();
    } catch (const YAML::Exception&) {
        errors.push_back(fmt::format("{}.{}: not a number '{}'", section, key,
                                     node[key].as<std::string>("")));
        return 0.0;
    }
}

static LocalConfig parse_local_config(const YAML::Node& node,
                                      std::vector<std::string>& errors) {
    LocalConfig local;
    local.top_outdir = expand_home(node["top_outdir"].as<std::string>(""));
    local.df_command = node["df_command"].as<std::string>("");
    local.max_usage = parse_size_node(node, "max_usage", "local", errors);
    local.min_free = parse_size_node(node, "min_free", "local", errors);
    local.usage_ratio = parse_ratio_node(node, "usage_ratio", "local", errors);
    return local;
}

static RemoteConfig parse_remote_config(const YAML::Node& node,
                                        std::vector<std::string>& errors) {
    RemoteConfig remote;
    remote.host = node["host"].as<std::string>("");
    remote.user = node["user"].as<std::string>("");
    remote.port = node["port"].as<int>(22);
    remote.timeout = node["timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);
    remote.command_timeout = node["command_timeout"].as<int>(SSH_CMD_TIMEOUT_SECS);
    remote.top_outdir = node["top_outdir"].as<std::string>("");
    remote.df_command = node["df_command"].as<std::string>("");
    remote.max_usage = parse_size_node(node, "max_usage", "remote", errors);
    remote.min_free = parse_size_node(node, "min_free", "remote", errors);
    remote.usage_ratio = parse_ratio_node(node, "usage_ratio", "remote", errors);

    if (node["ssh_key_path"]) {
        remote.ssh_key_path = expand_home(node["ssh_key_path"].as<std::string>());
    }

    if (node["password"] && !node["password"].as<std::string>("").empty()) {
        remote.password = node["password"].as<std::string>();
    }

    return remote;
}

fs::path Config::default_config_path() {
    return fs::current_path() / DEFAULT_CONFIG_FILE;
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::ConfigurationInvalid,
                                   "Config not found at " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);

        Config config;
        config.local_ = parse_local_config(root["local"] ? root["local"] : YAML::Node(),
                                           config.size_errors_);
        config.remote_ = parse_remote_config(root["remote"] ? root["remote"] : YAML::Node(),
                                             config.size_errors_);
        if (root["transfer"]) {
            config.transfer_.command = root["transfer"]["command"].as<std::string>("");
        }

        if (root["log_file"]) {
            config.log_file_ = expand_home(root["log_file"].as<std::string>());
        } else if (!config.local_.top_outdir.empty()) {
            config.log_file_ = fs::path(config.local_.top_outdir) / DEFAULT_LOG_FILE;
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigurationInvalid,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

static std::string join_problems(const std::vector<std::string>& problems) {
    std::string joined;
    for (const auto& p : problems) {
        if (!joined.empty()) joined += "; ";
        joined += p;
    }
    return joined;
}

static void collect_size_errors(const std::vector<std::string>& all,
                                const std::string& section,
                                std::vector<std::string>& out) {
    for (const auto& e : all) {
        if (e.rfind(section + ".", 0) == 0) out.push_back(e);
    }
}

Result<void> Config::validate_local() const {
    std::vector<std::string> problems;
    collect_size_errors(size_errors_, "local", problems);
    if (local_.top_outdir.empty()) problems.push_back("local.top_outdir is required");
    if (local_.max_usage < 0) problems.push_back("local.max_usage is required");
    if (local_.min_free < 0) problems.push_back("local.min_free is required");
    if (local_.usage_ratio <= 0) problems.push_back("local.usage_ratio must be a positive number");

    if (!problems.empty()) {
        return Result<void>::Err(ErrorKind::ConfigurationInvalid, join_problems(problems));
    }
    return Result<void>::Ok();
}

Result<void> Config::validate_remote() const {
    std::vector<std::string> problems;
    collect_size_errors(size_errors_, "remote", problems);
    if (local_.top_outdir.empty()) problems.push_back("local.top_outdir is required");
    if (remote_.host.empty()) problems.push_back("remote.host is required");
    if (remote_.user.empty()) problems.push_back("remote.user is required");
    if (remote_.top_outdir.empty()) problems.push_back("remote.top_outdir is required");
    if (remote_.df_command.empty()) problems.push_back("remote.df_command is required");
    if (remote_.max_usage < 0) problems.push_back("remote.max_usage is required");
    if (remote_.min_free < 0) problems.push_back("remote.min_free is required");
    if (remote_.usage_ratio <= 0) problems.push_back("remote.usage_ratio must be a positive number");
    if (!remote_.ssh_key_path && !remote_.password) {
        problems.push_back("remote.ssh_key_path or remote.password is required");
    }

    if (!problems.empty()) {
        return Result<void>::Err(ErrorKind::ConfigurationInvalid, join_problems(problems));
    }
    return Result<void>::Ok();
}

Result<void> Config::validate_transfer() const {
    auto remote = validate_remote();
    if (remote.is_err()) return remote;
    if (transfer_.command.empty()) {
        return Result<void>::Err(ErrorKind::ConfigurationInvalid,
                                 "transfer.command is required");
    }
    return Result<void>::Ok();
}
