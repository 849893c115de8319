#include "run_log.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <system_error>

const char* level_name(RunLog::Level level) {
    switch (level) {
        case RunLog::Level::Debug: return "DEBUG";
        case RunLog::Level::Info:  return "INFO";
        case RunLog::Level::Warn:  return "WARN";
        case RunLog::Level::Error: return "ERROR";
    }
    return "INFO";
}

RunLog::RunLog(const std::filesystem::path& path, StatusCallback console)
    : path_(path), console_(std::move(console)) {
    if (!path_.empty() && path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
}

void RunLog::write(Level level, const std::string& msg) {
    if (console_ && level != Level::Debug) {
        console_(level == Level::Info ? msg : fmt::format("{}: {}", level_name(level), msg));
    }

    if (path_.empty()) return;
    std::ofstream out(path_, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << level_name(level) << " " << msg << "\n";
}

void RunLog::command(const std::string& label, const std::string& cmd, const SSHResult& r) {
    debug(fmt::format("{} CMD: {}", label, cmd));
    debug(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                      r.stdout_data.size(), r.stdout_data.substr(0, LOG_OUTPUT_PREVIEW)));
    if (!r.stderr_data.empty())
        debug(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, LOG_OUTPUT_PREVIEW)));
}
