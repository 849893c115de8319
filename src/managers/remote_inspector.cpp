#include "remote_inspector.hpp"
#include "run_log.hpp"
#include <core/completion_tracker.hpp>
#include <core/size_metadata.hpp>
#include <core/size_units.hpp>
#include <core/utils.hpp>
#include <ssh/remote_exec.hpp>
#include <fmt/format.h>
#include <regex>
#include <set>

static std::string strip_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    return path;
}

static std::string basename_of(const std::string& path) {
    auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

RemoteInspector::RemoteInspector(RemoteExec& exec, RunLog& log)
    : exec_(exec), log_(log) {}

Result<SSHResult> RemoteInspector::query(const std::string& label,
                                         const std::string& command) {
    auto r = exec_.run(command);
    log_.command(fmt::format("{} [{}]", label, exec_.target()), command, r);
    if (r.failed()) {
        std::string why = r.stderr_data.empty() ? fmt::format("exit {}", r.exit_code)
                                                : r.stderr_data;
        trim(why);
        return Result<SSHResult>::Err(ErrorKind::RemoteQueryFailed,
                                      fmt::format("`{}` failed on {}: {}", command,
                                                  exec_.target(), why));
    }
    return Result<SSHResult>::Ok(r);
}

Result<int64_t> RemoteInspector::free_space(const std::string& df_command) {
    auto r = query("df", df_command);
    if (r.is_err()) return Result<int64_t>::Err(r.kind, r.error);

    auto bytes = parse_df_available(r.value.stdout_data);
    if (!bytes) {
        return Result<int64_t>::Err(ErrorKind::RemoteQueryFailed,
                                    fmt::format("cannot parse output of `{}`", df_command));
    }
    return Result<int64_t>::Ok(*bytes);
}

Result<int64_t> RemoteInspector::real_usage(const std::string& dir) {
    std::string cmd = fmt::format("du -s {}", shell_quote(dir));
    auto r = query("du", cmd);
    if (r.is_err()) return Result<int64_t>::Err(r.kind, r.error);

    auto bytes = parse_du_total(r.value.stdout_data);
    if (!bytes) {
        return Result<int64_t>::Err(ErrorKind::RemoteQueryFailed,
                                    fmt::format("cannot parse output of `{}`", cmd));
    }
    return Result<int64_t>::Ok(*bytes);
}

Result<std::vector<std::string>> RemoteInspector::listing(const std::string& dir) {
    std::string cmd = fmt::format("find {}", shell_quote(dir));
    auto r = query("find", cmd);
    if (r.is_err()) return Result<std::vector<std::string>>::Err(r.kind, r.error);

    std::vector<std::string> paths;
    for (auto& line : split_lines(r.value.stdout_data)) {
        trim(line);
        if (!line.empty()) paths.push_back(line);
    }
    if (paths.empty()) {
        return Result<std::vector<std::string>>::Err(
            ErrorKind::RemoteQueryFailed,
            fmt::format("{} does not exist on {}", dir, exec_.target()));
    }
    return Result<std::vector<std::string>>::Ok(paths);
}

Result<double> RemoteInspector::estimated_usage(const std::string& remote_top,
                                                const std::string& local_top,
                                                const UsageEstimator& estimator) {
    const std::string rtop = strip_trailing_slash(remote_top);
    const std::string ltop = strip_trailing_slash(local_top);

    auto paths = listing(rtop);
    if (paths.is_err()) return Result<double>::Err(paths.kind, paths.error);

    static const std::regex unit_re(R"(GSM\d+)");
    std::set<std::string> entries(paths.value.begin(), paths.value.end());

    double usage = 0;
    for (const auto& dir : entries) {
        if (!std::regex_match(basename_of(dir), unit_re)) continue;
        if (!CompletionTracker::remote_unit_needs_space(dir, entries)) continue;

        std::string local_dir = dir;
        if (dir.compare(0, rtop.size(), rtop) == 0) {
            local_dir = ltop + dir.substr(rtop.size());
        }

        auto total = fastq_gz_total(local_dir);
        if (total.is_err()) {
            return Result<double>::Err(
                total.kind,
                fmt::format("cannot estimate remote usage of {}: {}", dir, total.error));
        }
        double projected = estimator.estimate(total.value);
        log_.debug(fmt::format("remote {} in progress, estimated {}", dir,
                               format_size(projected)));
        usage += projected;
    }
    return Result<double>::Ok(usage);
}
