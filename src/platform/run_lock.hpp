#pragma once

#include <memory>
#include <string>
#include <filesystem>
#include <core/types.hpp>

// Marker-file lock for one admission cycle over an output tree.
// The marker is created with O_EXCL and holds pid, host, job id and start
// time. It is removed on release() or destruction; a marker left behind by a
// crashed cycle blocks later cycles until an operator removes it.
class RunLock {
public:
    // AlreadyLocked (message carries the marker path and contents) when the
    // marker exists, IoFailed when it cannot be created.
    static Result<std::unique_ptr<RunLock>> acquire(const std::filesystem::path& marker,
                                                    const std::string& job_id);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    void release();

    bool held() const { return held_; }
    const std::filesystem::path& path() const { return path_; }

private:
    explicit RunLock(const std::filesystem::path& marker) : path_(marker) {}

    std::filesystem::path path_;
    bool held_ = true;
};
