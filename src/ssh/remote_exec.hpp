#pragma once

#include <string>
#include <core/types.hpp>

// Run one command on a remote host and collect its output.
// exit_code -1 means the transport failed (connect, auth, timeout).
class RemoteExec {
public:
    virtual ~RemoteExec() = default;

    virtual SSHResult run(const std::string& command, int timeout_secs = 0) = 0;

    // "user@host" for log lines
    virtual std::string target() const = 0;
};
