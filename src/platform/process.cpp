#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <termios.h>
#include <pty.h>
#include <cerrno>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() = default;

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    other.pid_ = -1;
    other.reaped_ = false;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.reaped_ = false;
    }
    return *this;
}

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) record_status(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (true) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            record_status(status);
            return exit_code_;
        }
        if (ret < 0 || elapsed >= timeout_ms) break;
        sleep_ms(50);
        elapsed += 50;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    if (wait(grace_ms) >= 0 || reaped_) return;
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) record_status(status);
}

// ── PtyProcess ───────────────────────────────────────────────

PtyProcess::~PtyProcess() {
    close();
}

PtyProcess::PtyProcess(PtyProcess&& other) noexcept
    : master_fd_(other.master_fd_), process_(std::move(other.process_)) {
    other.master_fd_ = -1;
}

PtyProcess& PtyProcess::operator=(PtyProcess&& other) noexcept {
    if (this != &other) {
        close();
        master_fd_ = other.master_fd_;
        process_ = std::move(other.process_);
        other.master_fd_ = -1;
    }
    return *this;
}

void PtyProcess::close() {
    if (master_fd_ >= 0) {
        ::close(master_fd_);
        master_fd_ = -1;
    }
    // Closing the master hangs up the child; SIGTERM covers programs that ignore SIGHUP
    process_.terminate();
}

// ── spawn_pty ────────────────────────────────────────────────

PtyProcess spawn_pty(const std::string& program,
                     const std::vector<std::string>& args,
                     bool echo,
                     int* errno_out) {
    PtyProcess result;
    if (errno_out) *errno_out = 0;

    // Close-on-exec pipe: stays silent when exec succeeds, carries errno when it fails
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        if (errno_out) *errno_out = errno;
        return result;
    }

    int master_fd = -1;
    pid_t pid = forkpty(&master_fd, nullptr, nullptr, nullptr);
    if (pid < 0) {
        if (errno_out) *errno_out = errno;
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        ::close(status_pipe[0]);

        if (!echo) {
            struct termios tio;
            if (tcgetattr(STDIN_FILENO, &tio) == 0) {
                tio.c_lflag &= ~(ECHO | ECHOE | ECHOK | ECHONL);
                tcsetattr(STDIN_FILENO, TCSANOW, &tio);
            }
        }

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));

        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    ::close(status_pipe[1]);
    result.master_fd_ = master_fd;
    result.process_.pid_ = pid;

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        if (errno_out) *errno_out = child_errno;
        result.close();
        return PtyProcess();
    }

    return result;
}

} // namespace platform
