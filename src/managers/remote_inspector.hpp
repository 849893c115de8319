#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/usage_estimator.hpp>

class RemoteExec;
class RunLog;

// Disk queries against the remote host, one command each.
// Any transport failure or unparsable output is RemoteQueryFailed.
class RemoteInspector {
public:
    RemoteInspector(RemoteExec& exec, RunLog& log);

    // Available bytes reported by df_command (e.g. "df -k -P /remote/top").
    Result<int64_t> free_space(const std::string& df_command);

    // `du -s dir`, in bytes.
    Result<int64_t> real_usage(const std::string& dir);

    // `find dir`: every path under dir, dir itself included.
    Result<std::vector<std::string>> listing(const std::string& dir);

    // Projected analysis footprint of remote unit directories that are not
    // empty and have no rsem.COMPLETE yet. Each one is sized from the
    // fq_gzs_info.yaml of its local mirror (remote_top replaced by local_top).
    // A missing local mirror fails with MetadataMissing.
    Result<double> estimated_usage(const std::string& remote_top,
                                   const std::string& local_top,
                                   const UsageEstimator& estimator);

private:
    RemoteExec& exec_;
    RunLog& log_;

    Result<SSHResult> query(const std::string& label, const std::string& command);
};
