#pragma once

#include <map>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/completion_tracker.hpp>

struct UnitStatus {
    std::string key;
    UnitStage stage = UnitStage::NotStarted;
    bool transferred = false;       // listed in transferred_GSMs.txt
};

struct StatusReport {
    std::vector<UnitStatus> units;  // key order
    std::map<UnitStage, size_t> counts;
    size_t transferred = 0;
};

// Classify every unit under local.top_outdir. Read-only, takes no lock.
Result<StatusReport> collect_status(const Config& config);
