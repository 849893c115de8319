#pragma once

#include <string>
#include <optional>
#include <cstdint>

// Parse a human-readable size ("50 GB", "1TB", "1.5 gb", "4096") into bytes.
// Units are 1024-based: B, K/KB, M/MB, G/GB, T/TB, P/PB (case-insensitive).
// A bare number is bytes. Returns nullopt on anything unparsable or negative.
std::optional<int64_t> parse_size(const std::string& text);

// Format bytes with one decimal: 1048576 -> "1.0 MB", 2546696608 -> "2.4 GB".
// Values below 1 KB print as whole bytes ("512 B"). Negative values keep their sign.
std::string format_size(double bytes);

// Available bytes from `df -k -P <dir>` output (second line, fourth column, KiB).
std::optional<int64_t> parse_df_available(const std::string& output);

// Total bytes from `du -s <dir>` output (first column, KiB).
std::optional<int64_t> parse_du_total(const std::string& output);
