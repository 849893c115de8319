#include "run_lock.hpp"
#include "platform.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string read_marker(const fs::path& marker) {
    std::ifstream in(marker);
    if (!in) return "";
    std::stringstream ss;
    ss << in.rdbuf();
    std::string text = ss.str();
    trim(text);
    return text;
}

Result<std::unique_ptr<RunLock>> RunLock::acquire(const fs::path& marker,
                                                  const std::string& job_id) {
    using R = Result<std::unique_ptr<RunLock>>;

    int fd = open(marker.c_str(), O_CREAT | O_EXCL | O_WRONLY, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            std::string holder = read_marker(marker);
            return R::Err(ErrorKind::AlreadyLocked,
                          fmt::format("{} exists, another cycle is running or did not finish"
                                      " (remove it manually if stale){}{}",
                                      marker.string(), holder.empty() ? "" : ": ",
                                      holder));
        }
        return R::Err(ErrorKind::IoFailed,
                      fmt::format("Cannot create {}: {}", marker.string(), strerror(errno)));
    }

    std::string body = fmt::format("pid: {}\nhost: {}\njob: {}\nstarted: {}\n",
                                   platform::process_id(), platform::hostname(),
                                   job_id, now_iso());
    ssize_t n = write(fd, body.data(), body.size());
    close(fd);
    if (n != static_cast<ssize_t>(body.size())) {
        std::error_code ec;
        fs::remove(marker, ec);
        return R::Err(ErrorKind::IoFailed, "Failed to write " + marker.string());
    }

    return R::Ok(std::unique_ptr<RunLock>(new RunLock(marker)));
}

RunLock::~RunLock() {
    release();
}

void RunLock::release() {
    if (!held_) return;
    held_ = false;
    std::error_code ec;
    fs::remove(path_, ec);
}
