#include "local_disk.hpp"
#include "run_log.hpp"
#include <core/size_units.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <system_error>

namespace fs = std::filesystem;

LocalDisk::LocalDisk(const LocalConfig& local, RunLog& log) : local_(local), log_(log) {}

Result<int64_t> LocalDisk::free_space() {
    if (!local_.df_command.empty()) {
        SSHResult r{0, "", ""};
        r.exit_code = platform::capture_shell(local_.df_command, r.stdout_data);
        log_.command("df [local]", local_.df_command, r);
        if (r.failed()) {
            return Result<int64_t>::Err(ErrorKind::IoFailed,
                                        fmt::format("`{}` exited with {}",
                                                    local_.df_command, r.exit_code));
        }
        auto bytes = parse_df_available(r.stdout_data);
        if (!bytes) {
            return Result<int64_t>::Err(ErrorKind::IoFailed,
                                        fmt::format("cannot parse output of `{}`",
                                                    local_.df_command));
        }
        return Result<int64_t>::Ok(*bytes);
    }

    std::error_code ec;
    auto info = fs::space(local_.top_outdir, ec);
    if (ec) {
        return Result<int64_t>::Err(ErrorKind::IoFailed,
                                    fmt::format("statvfs {}: {}", local_.top_outdir,
                                                ec.message()));
    }
    return Result<int64_t>::Ok(static_cast<int64_t>(info.available));
}

Result<int64_t> LocalDisk::real_usage() {
    return directory_usage(local_.top_outdir);
}

Result<int64_t> directory_usage(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result<int64_t>::Err(ErrorKind::IoFailed, dir.string() + " is not a directory");
    }

    int64_t total = 0;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Result<int64_t>::Err(ErrorKind::IoFailed,
                                    fmt::format("cannot walk {}: {}", dir.string(), ec.message()));
    }
    const fs::recursive_directory_iterator end;
    while (it != end) {
        std::error_code fec;
        if (!it->is_symlink(fec) && it->is_regular_file(fec)) {
            auto size = it->file_size(fec);
            if (!fec) total += static_cast<int64_t>(size);
        }
        it.increment(ec);
        if (ec) {
            return Result<int64_t>::Err(ErrorKind::IoFailed,
                                        fmt::format("cannot walk {}: {}", dir.string(),
                                                    ec.message()));
        }
    }
    return Result<int64_t>::Ok(total);
}
