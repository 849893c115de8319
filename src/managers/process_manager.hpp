#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <core/capacity_model.hpp>
#include <core/admission_selector.hpp>

class RunLog;

struct RunOptions {
    bool ignore_disk_usage = false;
    std::filesystem::path output_file;      // admitted keys, one per line; empty = none
};

struct RunReport {
    std::string job_name;
    size_t discovered = 0;
    CapacitySnapshot snapshot;
    int64_t budget = 0;
    AdmissionResult selection;
};

// One local processing admission cycle over local.top_outdir:
// lock, discover units, measure the disk, select, hand off the admitted keys.
class ProcessManager {
public:
    ProcessManager(const Config& config, RunLog& log);

    // AlreadyLocked when .rp-run exists. Nothing is measured in that case.
    Result<RunReport> run_cycle(const RunOptions& opts);

private:
    const Config& config_;
    RunLog& log_;

    Result<void> write_admitted(const std::filesystem::path& file,
                                const std::vector<std::string>& keys);
};
