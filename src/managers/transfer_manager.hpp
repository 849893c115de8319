#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <core/capacity_model.hpp>
#include <core/admission_selector.hpp>

class RemoteExec;
class RunLog;

struct TransferReport {
    std::string job_name;               // transfer.yy-mm-dd_HH:MM:SS
    CapacitySnapshot snapshot;          // current_usage is the estimate
    int64_t real_usage = 0;             // `du -s`, informational
    int64_t budget = 0;
    AdmissionResult selection;
    std::filesystem::path keys_file;    // empty when nothing was admitted
    int command_exit = -1;              // -1 when the command did not run
    bool ledger_updated = false;
};

// One remote transfer cycle: lock, query the remote disk, select converted
// units that fit, run the transfer command, record the keys in the ledger.
class TransferManager {
public:
    TransferManager(const Config& config, RemoteExec& remote, RunLog& log);

    // AlreadyLocked when .rp-transfer exists; RemoteQueryFailed when any
    // remote query fails. A failing transfer command is reported through
    // command_exit and leaves the ledger untouched.
    Result<TransferReport> run_cycle();

    // Substitute {job_name} {keys_file} {local_top_outdir} {remote_top_outdir}
    // {host} {user} into the configured command.
    Result<std::string> render_command(const std::string& job_name,
                                       const std::filesystem::path& keys_file) const;

private:
    const Config& config_;
    RemoteExec& remote_;
    RunLog& log_;

    Result<std::filesystem::path> write_keys_file(const std::string& job_name,
                                                  const std::vector<std::string>& keys);
};
