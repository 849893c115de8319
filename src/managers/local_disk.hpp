#pragma once

#include <cstdint>
#include <string>
#include <filesystem>
#include <core/types.hpp>

class RunLog;

// Disk figures for the local output tree.
class LocalDisk {
public:
    LocalDisk(const LocalConfig& local, RunLog& log);

    // Bytes available to the tree: from df_command when configured,
    // otherwise from the filesystem holding top_outdir.
    Result<int64_t> free_space();

    // Bytes currently taken by regular files under top_outdir.
    Result<int64_t> real_usage();

private:
    const LocalConfig& local_;
    RunLog& log_;
};

// Sum of regular file sizes below dir (symlinks are not followed).
Result<int64_t> directory_usage(const std::filesystem::path& dir);
