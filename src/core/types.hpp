#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Failure categories surfaced to the CLI
enum class ErrorKind {
    None,
    ConfigurationInvalid,   // required capacity parameter missing or unparsable
    RemoteQueryFailed,      // df/du/find on the remote host failed or was unparsable
    AlreadyLocked,          // another cycle holds the run marker
    MetadataMissing,        // size metadata needed for an estimate is absent
    IoFailed,               // local filesystem error (ledger, keys file, probes)
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool failed() const { return exit_code != 0; }
};

// Configuration structures
struct LocalConfig {
    std::string top_outdir;
    std::string df_command;                 // empty: statvfs on top_outdir
    int64_t max_usage = 0;
    int64_t min_free = 0;
    double usage_ratio = 0.0;               // .sra bytes -> peak processing footprint
};

struct RemoteConfig {
    std::string host;
    std::string user;
    int port = 22;
    std::optional<std::string> ssh_key_path;
    std::optional<std::string> password;
    int timeout = 30;                       // connect timeout (s)
    int command_timeout = 300;              // per query (s)
    std::string top_outdir;
    std::string df_command;
    int64_t max_usage = 0;
    int64_t min_free = 0;
    double usage_ratio = 0.0;               // fastq.gz bytes -> analysis footprint
};

struct TransferConfig {
    std::string command;                    // fmt template, see transfer_manager.cpp
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
