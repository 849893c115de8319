#include "exec_session.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <chrono>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

ExecSession::ExecSession(const RemoteConfig& remote) : remote_(remote) {}

ExecSession::~ExecSession() {
    close();
    if (lib_initialized_) libssh2_exit();
}

std::string ExecSession::target() const {
    return remote_.user + "@" + remote_.host;
}

SSHResult ExecSession::fail(const std::string& msg) {
    close();
    return SSHResult{-1, "", msg};
}

SSHResult ExecSession::connect_socket() {
    std::string error;
    sock_ = platform::connect_tcp(remote_.host, remote_.port, remote_.timeout * 1000, error);
    if (sock_ == RPCTL_INVALID_SOCKET) {
        return SSHResult{-1, "", error};
    }

    // Enable TCP keepalive on the socket
    int tcp_keepalive = 1;
    setsockopt(sock_, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(sock_, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
    return SSHResult{0, "", ""};
}

SSHResult ExecSession::establish() {
    if (active_) return SSHResult{0, "", ""};

    int rc;
    if (!lib_initialized_) {
        if (libssh2_init(0) != 0) {
            return SSHResult{-1, "", "Failed to initialize libssh2"};
        }
        lib_initialized_ = true;
    }

    auto sock_result = connect_socket();
    if (sock_result.failed()) return sock_result;

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return fail("Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(remote_.timeout);
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return fail("SSH handshake timed out: " + remote_.host);
        }
        platform::sleep_ms(50);
    }
    if (rc != 0) {
        return fail("SSH handshake failed: " + remote_.host);
    }

    libssh2_keepalive_config(session_, 1, 30);

    auto auth = userauth(deadline);
    if (auth.failed()) {
        return fail(auth.stderr_data);
    }

    active_ = true;
    return SSHResult{0, "", ""};
}

SSHResult ExecSession::userauth(std::chrono::steady_clock::time_point deadline) {
    int rc = -1;
    const std::string& user = remote_.user;

    if (remote_.ssh_key_path) {
        const char* passphrase = remote_.password ? remote_.password->c_str() : "";
        while ((rc = libssh2_userauth_publickey_fromfile(
                    session_, user.c_str(), nullptr,
                    remote_.ssh_key_path->c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return SSHResult{-1, "", "Authentication timed out for " + target()};
            }
            platform::sleep_ms(50);
        }
        if (rc == 0) return SSHResult{0, "", ""};
    }

    if (remote_.password) {
        while ((rc = libssh2_userauth_password(
                    session_, user.c_str(), remote_.password->c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return SSHResult{-1, "", "Authentication timed out for " + target()};
            }
            platform::sleep_ms(50);
        }
        if (rc == 0) return SSHResult{0, "", ""};
    }

    return SSHResult{-1, "", "Authentication failed for " + target()};
}

SSHResult ExecSession::run(const std::string& command, int timeout_secs) {
    if (!active_) {
        auto est = establish();
        if (est.failed()) return est;
    }

    std::lock_guard<std::mutex> lock(io_mutex_);
    int effective_timeout = (timeout_secs > 0) ? timeout_secs : remote_.command_timeout;
    if (effective_timeout <= 0) effective_timeout = SSH_CMD_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);

    // Open a new exec channel (no PTY)
    LIBSSH2_CHANNEL* channel = nullptr;
    while ((channel = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN ||
            std::chrono::steady_clock::now() >= deadline) {
            return SSHResult{-1, "", "Failed to open exec channel on " + target()};
        }
        platform::sleep_ms(10);
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        platform::sleep_ms(10);
    }
    if (rc != 0) {
        libssh2_channel_free(channel);
        return SSHResult{-1, "", "Failed to exec command on " + target()};
    }

    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    bool timed_out = true;

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n = libssh2_channel_read(channel, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            libssh2_channel_free(channel);
            return SSHResult{-1, output, "SSH channel read error"};
        }

        ssize_t m = libssh2_channel_read_stderr(channel, buf, sizeof(buf));
        if (m > 0) {
            stderr_data.append(buf, static_cast<size_t>(m));
            continue;
        }

        if (libssh2_channel_eof(channel)) {
            timed_out = false;
            break;
        }
        platform::sleep_ms(10);
    }

    if (timed_out) {
        libssh2_channel_free(channel);
        return SSHResult{-1, output,
                         "Command timed out after " + std::to_string(effective_timeout) + "s"};
    }

    int exit_status = -1;
    while ((rc = libssh2_channel_close(channel)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(10);
    }
    if (rc == 0) {
        exit_status = libssh2_channel_get_exit_status(channel);
    }
    libssh2_channel_free(channel);

    return SSHResult{exit_status, output, stderr_data};
}

void ExecSession::close() {
    active_ = false;

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != RPCTL_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = RPCTL_INVALID_SOCKET;
    }
}
