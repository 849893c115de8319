#include "transfer_manager.hpp"
#include "remote_inspector.hpp"
#include "run_log.hpp"
#include "transfer_ledger.hpp"
#include <core/completion_tracker.hpp>
#include <core/constants.hpp>
#include <core/size_units.hpp>
#include <core/unit.hpp>
#include <core/usage_estimator.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <platform/run_lock.hpp>
#include <ssh/remote_exec.hpp>
#include <fmt/format.h>
#include <cmath>
#include <fstream>

namespace fs = std::filesystem;

TransferManager::TransferManager(const Config& config, RemoteExec& remote, RunLog& log)
    : config_(config), remote_(remote), log_(log) {}

Result<std::string> TransferManager::render_command(const std::string& job_name,
                                                    const fs::path& keys_file) const {
    const auto& local = config_.local();
    const auto& remote = config_.remote();
    try {
        return Result<std::string>::Ok(fmt::format(
            fmt::runtime(config_.transfer().command),
            fmt::arg("job_name", job_name),
            fmt::arg("keys_file", keys_file.string()),
            fmt::arg("local_top_outdir", local.top_outdir),
            fmt::arg("remote_top_outdir", remote.top_outdir),
            fmt::arg("host", remote.host),
            fmt::arg("user", remote.user)));
    } catch (const fmt::format_error& e) {
        return Result<std::string>::Err(ErrorKind::ConfigurationInvalid,
                                        fmt::format("transfer.command: {}", e.what()));
    }
}

Result<fs::path> TransferManager::write_keys_file(const std::string& job_name,
                                                  const std::vector<std::string>& keys) {
    fs::path dir = fs::path(config_.local().top_outdir) / TRANSFER_SCRIPTS_DIR;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<fs::path>::Err(ErrorKind::IoFailed,
                                     fmt::format("Cannot create {}: {}", dir.string(),
                                                 ec.message()));
    }

    fs::path file = dir / (job_name + ".keys");
    std::ofstream out(file);
    if (!out) {
        return Result<fs::path>::Err(ErrorKind::IoFailed, "Cannot write " + file.string());
    }
    for (const auto& k : keys) out << k << "\n";
    out.flush();
    if (!out) {
        return Result<fs::path>::Err(ErrorKind::IoFailed, "Failed writing " + file.string());
    }
    return Result<fs::path>::Ok(file);
}

Result<TransferReport> TransferManager::run_cycle() {
    using R = Result<TransferReport>;

    auto valid = config_.validate_transfer();
    if (valid.is_err()) return R::Err(valid.kind, valid.error);

    const auto& local = config_.local();
    const auto& remote = config_.remote();
    fs::path top = local.top_outdir;
    std::error_code ec;
    if (!fs::is_directory(top, ec)) {
        return R::Err(ErrorKind::ConfigurationInvalid,
                      fmt::format("local.top_outdir {} is not a directory", top.string()));
    }

    TransferReport report;
    report.job_name = make_transfer_job_name();

    auto lock = RunLock::acquire(top / TRANSFER_LOCK_FILE, report.job_name);
    if (lock.is_err()) return R::Err(lock.kind, lock.error);
    log_.debug(fmt::format("{} acquired {}", report.job_name, lock.value->path().string()));

    TransferLedger ledger(top / TRANSFER_LEDGER_FILE);
    auto transferred = ledger.read();
    if (transferred.is_err()) return R::Err(transferred.kind, transferred.error);

    // Remote disk figures
    UsageEstimator estimator(remote.usage_ratio);
    RemoteInspector inspector(remote_, log_);

    auto free = inspector.free_space(remote.df_command);
    if (free.is_err()) return R::Err(free.kind, free.error);
    log_.info(fmt::format("r_free_space: {}: {}", remote.host,
                          format_size(static_cast<double>(free.value))));

    auto real = inspector.real_usage(remote.top_outdir);
    if (real.is_err()) return R::Err(real.kind, real.error);
    report.real_usage = real.value;
    log_.info(fmt::format("real current usage on {} by {}: {}", remote.host,
                          remote.top_outdir, format_size(static_cast<double>(real.value))));

    auto est = inspector.estimated_usage(remote.top_outdir, local.top_outdir, estimator);
    if (est.is_err()) return R::Err(est.kind, est.error);
    log_.info(fmt::format("estimated current usage (excluding GSMs with {}) on {} by {}: {}",
                          ANALYSIS_COMPLETE_FLAG, remote.host, remote.top_outdir,
                          format_size(est.value)));

    report.snapshot.free_space = free.value;
    report.snapshot.max_usage = remote.max_usage;
    report.snapshot.min_free = remote.min_free;
    report.snapshot.current_usage = static_cast<int64_t>(std::llround(est.value));
    report.budget = remote_budget(report.snapshot);
    log_.info(describe(report.snapshot, CapacityVariant::Remote));

    // Selection
    auto units = discover_units(top);
    CompletionTracker tracker;
    RemoteTransferPolicy policy(tracker, estimator);
    AdmissionSelector selector(log_);
    report.selection = selector.select(units, report.budget, transferred.value, policy);

    auto keys = report.selection.admitted_keys();
    if (keys.empty()) {
        log_.info("Cannot find a GSM that fits the current disk usage rule");
        return R::Ok(std::move(report));
    }

    log_.info("GSMs to transfer:");
    for (const auto& k : keys) log_.info("\t" + k);

    // Transfer
    auto keys_file = write_keys_file(report.job_name, keys);
    if (keys_file.is_err()) return R::Err(keys_file.kind, keys_file.error);
    report.keys_file = keys_file.value;

    auto cmd = render_command(report.job_name, report.keys_file);
    if (cmd.is_err()) return R::Err(cmd.kind, cmd.error);

    log_.info(fmt::format("running {}: {}", report.job_name, cmd.value));
    report.command_exit = platform::run_shell(cmd.value, log_.path().string());
    if (report.command_exit != 0) {
        log_.error(fmt::format("{} exited with {}, {} not updated", report.job_name,
                               report.command_exit, ledger.path().string()));
        return R::Ok(std::move(report));
    }

    auto appended = ledger.append(keys);
    if (appended.is_err()) return R::Err(appended.kind, appended.error);
    report.ledger_updated = true;
    log_.info(fmt::format("{} GSMs recorded in {}", keys.size(), ledger.path().string()));

    return R::Ok(std::move(report));
}
