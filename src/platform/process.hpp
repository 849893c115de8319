#pragma once

#include <string>
#include <vector>

namespace platform {

// Handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process was successfully spawned.
    bool valid() const { return pid_ > 0; }

    // Wait for the process to exit. Returns the exit code, -1 if it was
    // killed by a signal.
    int wait();

private:
    int pid_ = -1;
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& output_log);
};

// Spawn a child process.
// output_log: if non-empty, the child's stdout and stderr are appended to it.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& output_log = "");

// Run `/bin/sh -c command` to completion. Returns its exit code, 127 when
// the shell could not be started.
int run_shell(const std::string& command, const std::string& output_log = "");

// Run `/bin/sh -c command` and collect its stdout. Returns the exit code,
// -1 when the pipe could not be opened.
int capture_shell(const std::string& command, std::string& output);

} // namespace platform
