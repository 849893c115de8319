#include "size_units.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

static const char* const UNITS[] = {"B", "KB", "MB", "GB", "TB", "PB"};
static constexpr int NUM_UNITS = 6;

std::optional<int64_t> parse_size(const std::string& text) {
    // Find where the numeric part ends
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) i++;
    size_t num_start = i;
    while (i < text.size() &&
           (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.')) {
        i++;
    }
    if (i == num_start) return std::nullopt;

    double value;
    try {
        value = std::stod(text.substr(num_start, i - num_start));
    } catch (const std::exception&) {
        return std::nullopt;
    }

    std::string suffix;
    for (; i < text.size(); i++) {
        if (std::isspace(static_cast<unsigned char>(text[i]))) continue;
        suffix += static_cast<char>(std::toupper(static_cast<unsigned char>(text[i])));
    }
    if (suffix.size() == 2 && suffix[1] == 'B' && suffix[0] != 'B') suffix.pop_back();

    int exponent;
    if (suffix.empty() || suffix == "B")  exponent = 0;
    else if (suffix == "K")               exponent = 1;
    else if (suffix == "M")               exponent = 2;
    else if (suffix == "G")               exponent = 3;
    else if (suffix == "T")               exponent = 4;
    else if (suffix == "P")               exponent = 5;
    else return std::nullopt;

    double bytes = value * std::pow(1024.0, exponent);
    if (!std::isfinite(bytes) || bytes < 0) return std::nullopt;
    if (bytes >= static_cast<double>(std::numeric_limits<int64_t>::max())) return std::nullopt;
    return static_cast<int64_t>(std::llround(bytes));
}

std::string format_size(double bytes) {
    double magnitude = std::fabs(bytes);
    const char* sign = bytes < 0 ? "-" : "";
    if (magnitude < 1024.0) {
        return fmt::format("{}{:.0f} B", sign, magnitude);
    }
    int unit = 0;
    while (magnitude >= 1024.0 && unit < NUM_UNITS - 1) {
        magnitude /= 1024.0;
        unit++;
    }
    return fmt::format("{}{:.1f} {}", sign, magnitude, UNITS[unit]);
}

// `df -k -P`: header line, then "fs 1024-blocks used available capacity mount"
std::optional<int64_t> parse_df_available(const std::string& output) {
    std::istringstream stream(output);
    std::string line;
    int index = 0;
    while (std::getline(stream, line)) {
        if (index++ != 1) continue;
        std::istringstream fields(line);
        std::string f;
        for (int i = 0; i < 4; i++) {
            if (!(fields >> f)) return std::nullopt;
        }
        if (f.empty() || f.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        try {
            return static_cast<int64_t>(std::stoll(f)) * 1024;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// `du -s dir`: "3096\t/path/to/dir"
std::optional<int64_t> parse_du_total(const std::string& output) {
    std::istringstream stream(output);
    std::string kb;
    if (!(stream >> kb)) return std::nullopt;
    if (kb.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
    try {
        return static_cast<int64_t>(std::stoll(kb)) * 1024;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
