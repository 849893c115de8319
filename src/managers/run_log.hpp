#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

// Append-only cycle log: "[HH:MM:SS.mmm] LEVEL message" lines in a file,
// with INFO and above mirrored to an optional console sink.
class RunLog {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Empty path disables the file; a null sink disables the console.
    explicit RunLog(const std::filesystem::path& path = {},
                    StatusCallback console = nullptr);

    void debug(const std::string& msg) { write(Level::Debug, msg); }
    void info(const std::string& msg) { write(Level::Info, msg); }
    void warn(const std::string& msg) { write(Level::Warn, msg); }
    void error(const std::string& msg) { write(Level::Error, msg); }

    // Log a remote/local command with its exit code and a truncated output preview.
    void command(const std::string& label, const std::string& cmd, const SSHResult& r);

    void write(Level level, const std::string& msg);

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    StatusCallback console_;
};

const char* level_name(RunLog::Level level);
