#pragma once

#include <string>
#include <vector>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Ledger comment stamp: "yy-mm-dd HH:MM:SS".
std::string now_ledger_stamp();

// "<prefix>.yy-mm-dd_HH:MM:SS"
std::string make_job_name(const std::string& prefix);

// Transfer job identifier: "transfer.yy-mm-dd_HH:MM:SS".
std::string make_transfer_job_name();

// Expand a leading "~/" against $HOME.
std::string expand_home(const std::string& path);

// Single-quote for /bin/sh, with ' -> '\''
std::string shell_quote(const std::string& arg);

// Split text into lines with trailing '\r' removed. Empty lines are dropped.
std::vector<std::string> split_lines(const std::string& text);

// Split on runs of spaces/tabs.
std::vector<std::string> split_ws(const std::string& line);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
