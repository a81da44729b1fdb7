#pragma once

#include <string>
#include <vector>

namespace platform {

class PtyProcess;

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns exit code.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM, then SIGKILL after grace_ms).
    void terminate(int grace_ms = 2000);

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;

    void record_status(int status);

    friend class PtyProcess;
    friend PtyProcess spawn_pty(const std::string& program,
                                const std::vector<std::string>& args,
                                bool echo,
                                int* errno_out);
};

// A child process whose stdin/stdout/stderr are the slave side of a
// pseudo-terminal. The parent talks to it through master_fd().
class PtyProcess {
public:
    PtyProcess() = default;
    ~PtyProcess();

    PtyProcess(PtyProcess&& other) noexcept;
    PtyProcess& operator=(PtyProcess&& other) noexcept;
    PtyProcess(const PtyProcess&) = delete;
    PtyProcess& operator=(const PtyProcess&) = delete;

    bool valid() const { return master_fd_ >= 0 && process_.valid(); }
    int master_fd() const { return master_fd_; }
    ProcessHandle& process() { return process_; }

    // Close the master side and terminate the child.
    void close();

private:
    int master_fd_ = -1;
    ProcessHandle process_;

    friend PtyProcess spawn_pty(const std::string& program,
                                const std::vector<std::string>& args,
                                bool echo,
                                int* errno_out);
};

// Spawn a child process on a new pseudo-terminal (forkpty + execvp).
// echo: leave terminal echo on, so input written to the master is reflected back.
// Returns an invalid PtyProcess if the pty, fork or exec fails; errno_out
// (if given) receives the errno of the failing call.
PtyProcess spawn_pty(const std::string& program,
                     const std::vector<std::string>& args,
                     bool echo = false,
                     int* errno_out = nullptr);

} // namespace platform
