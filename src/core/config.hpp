#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file (default ./rpctl.yaml)
    static Result<Config> load(const fs::path& path = default_config_path());

    // Parse from YAML text (used by load and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    static fs::path default_config_path();

    // Check the values each sub-command needs. ConfigurationInvalid on failure.
    Result<void> validate_local() const;
    Result<void> validate_remote() const;
    Result<void> validate_transfer() const;

    // Accessors
    const LocalConfig& local() const { return local_; }
    const RemoteConfig& remote() const { return remote_; }
    const TransferConfig& transfer() const { return transfer_; }
    const fs::path& log_file() const { return log_file_; }

public:
    Config() = default;

private:
    LocalConfig local_;
    RemoteConfig remote_;
    TransferConfig transfer_;
    fs::path log_file_;

    // Human-readable sizes that failed to parse, reported by validate_*()
    std::vector<std::string> size_errors_;
};
