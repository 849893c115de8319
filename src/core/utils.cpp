#include "utils.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <sstream>

static std::string format_now(const char* pattern) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[64];
    std::strftime(buf, sizeof(buf), pattern, &tm_buf);
    return std::string(buf);
}

std::string now_iso() {
    return format_now("%Y-%m-%dT%H:%M:%S");
}

std::string now_ledger_stamp() {
    return format_now("%y-%m-%d %H:%M:%S");
}

std::string make_job_name(const std::string& prefix) {
    return prefix + "." + format_now("%y-%m-%d_%H:%M:%S");
}

std::string make_transfer_job_name() {
    return make_job_name("transfer");
}

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

std::string shell_quote(const std::string& arg) {
    std::string escaped;
    escaped.reserve(arg.size() + 2);
    escaped += '\'';
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped += c;
        }
    }
    escaped += '\'';
    return escaped;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> split_ws(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream stream(line);
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    return fields;
}
