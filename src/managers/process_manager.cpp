#include "process_manager.hpp"
#include "local_disk.hpp"
#include "run_log.hpp"
#include <core/completion_tracker.hpp>
#include <core/constants.hpp>
#include <core/size_units.hpp>
#include <core/unit.hpp>
#include <core/usage_estimator.hpp>
#include <core/utils.hpp>
#include <platform/run_lock.hpp>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

ProcessManager::ProcessManager(const Config& config, RunLog& log)
    : config_(config), log_(log) {}

Result<RunReport> ProcessManager::run_cycle(const RunOptions& opts) {
    auto valid = config_.validate_local();
    if (valid.is_err()) return Result<RunReport>::Err(valid.kind, valid.error);

    const auto& local = config_.local();
    fs::path top = local.top_outdir;
    std::error_code ec;
    if (!fs::is_directory(top, ec)) {
        return Result<RunReport>::Err(ErrorKind::ConfigurationInvalid,
                                      fmt::format("local.top_outdir {} is not a directory",
                                                  top.string()));
    }

    RunReport report;
    report.job_name = make_job_name("run");

    auto lock = RunLock::acquire(top / RUN_LOCK_FILE, report.job_name);
    if (lock.is_err()) return Result<RunReport>::Err(lock.kind, lock.error);
    log_.debug(fmt::format("{} acquired {}", report.job_name, lock.value->path().string()));

    auto units = discover_units(top);
    report.discovered = units.size();
    log_.info(fmt::format("{} GSMs found under {}", units.size(), top.string()));

    CompletionTracker tracker;
    UsageEstimator estimator(local.usage_ratio);
    LocalProcessingPolicy policy(tracker, estimator);
    AdmissionSelector selector(log_);

    if (opts.ignore_disk_usage) {
        log_.warn("disk usage rule ignored, every unfinished GSM is admitted");
        report.selection = selector.select(units, 0, {}, policy, true);
    } else {
        LocalDisk disk(local, log_);
        auto free = disk.free_space();
        if (free.is_err()) return Result<RunReport>::Err(free.kind, free.error);
        auto used = disk.real_usage();
        if (used.is_err()) return Result<RunReport>::Err(used.kind, used.error);

        report.snapshot.free_space = free.value;
        report.snapshot.max_usage = local.max_usage;
        report.snapshot.min_free = local.min_free;
        report.snapshot.current_usage = used.value;
        report.budget = local_budget(report.snapshot);
        log_.info(describe(report.snapshot, CapacityVariant::Local));

        report.selection = selector.select(units, report.budget, {}, policy);
    }

    const auto& admitted = report.selection.admitted;
    if (admitted.empty()) {
        log_.info("Cannot find a GSM that fits the disk usage rule");
    } else {
        log_.info("GSMs to process:");
        for (size_t i = 0; i < admitted.size(); i++) {
            log_.info(fmt::format("\t{:3d} {:30s} {}", i + 1, admitted[i].name,
                                  admitted[i].outdir.string()));
        }
    }

    if (!opts.output_file.empty()) {
        auto written = write_admitted(opts.output_file, report.selection.admitted_keys());
        if (written.is_err()) return Result<RunReport>::Err(written.kind, written.error);
    }

    return Result<RunReport>::Ok(std::move(report));
}

Result<void> ProcessManager::write_admitted(const fs::path& file,
                                            const std::vector<std::string>& keys) {
    std::ofstream out(file, std::ios::trunc);
    if (!out) {
        return Result<void>::Err(ErrorKind::IoFailed, "Cannot write " + file.string());
    }
    for (const auto& k : keys) out << k << "\n";
    out.flush();
    if (!out) {
        return Result<void>::Err(ErrorKind::IoFailed, "Failed writing " + file.string());
    }
    log_.debug(fmt::format("{} admitted keys written to {}", keys.size(), file.string()));
    return Result<void>::Ok();
}
