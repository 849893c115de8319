#pragma once

#include <cstdint>
#include <string>

// Disk figures captured once at the start of an admission decision (bytes)
struct CapacitySnapshot {
    int64_t free_space = 0;
    int64_t max_usage = 0;          // configured ceiling for our tree
    int64_t min_free = 0;           // reserve left for everyone else
    int64_t current_usage = 0;      // measured (local) or estimated (remote)
};

enum class CapacityVariant { Local, Remote };

// Local:  min(max_usage, free_space) - current_usage - min_free
int64_t local_budget(const CapacitySnapshot& s);

// Remote: min(min(max_usage, free_space) - current_usage, free_space - min_free)
int64_t remote_budget(const CapacitySnapshot& s);

int64_t budget(const CapacitySnapshot& s, CapacityVariant variant);

// A non-positive budget admits nothing. Not an error.
inline bool budget_exhausted(int64_t budget) { return budget <= 0; }

// One-line summary for the log
std::string describe(const CapacitySnapshot& s, CapacityVariant variant);
