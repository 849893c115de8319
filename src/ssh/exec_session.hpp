#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "remote_exec.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// One authenticated SSH session; every run() opens a fresh exec channel
// (no PTY), reads stdout/stderr until EOF and returns the exit status.
// The session is established lazily on the first run().
class ExecSession : public RemoteExec {
public:
    explicit ExecSession(const RemoteConfig& remote);
    ~ExecSession() override;

    ExecSession(const ExecSession&) = delete;
    ExecSession& operator=(const ExecSession&) = delete;

    SSHResult establish();
    void close();

    SSHResult run(const std::string& command, int timeout_secs = 0) override;
    std::string target() const override;

private:
    const RemoteConfig& remote_;
    LIBSSH2_SESSION* session_ = nullptr;
    socket_t sock_ = RPCTL_INVALID_SOCKET;
    bool active_ = false;
    bool lib_initialized_ = false;
    std::mutex io_mutex_;

    SSHResult connect_socket();
    SSHResult userauth(std::chrono::steady_clock::time_point deadline);
    SSHResult fail(const std::string& msg);
};
