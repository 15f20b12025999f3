#include "mcplink/process/child_process.hpp"
#include "mcplink/log/logger.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <thread>
#include <utility>

namespace mcplink {

namespace {

constexpr std::string_view kComponent = "process";
constexpr std::chrono::milliseconds kExitPollInterval{10};

ProcessError make_error(const std::string& what, int err) {
    return ProcessError{what + ": " + std::strerror(err), err};
}

void close_if_open(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int read_end{-1};
    int write_end{-1};

    ~PipePair() {
        close_if_open(read_end);
        close_if_open(write_end);
    }

    [[nodiscard]] bool open() noexcept {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) == -1) {
            return false;
        }
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    [[nodiscard]] int take_read() noexcept { return std::exchange(read_end, -1); }
    [[nodiscard]] int take_write() noexcept { return std::exchange(write_end, -1); }
};

// Child side of the fork. Only async-signal-safe calls from here on.
[[noreturn]] void exec_child(
    char* const* argv,
    int stdin_read,
    int stdout_write,
    int devnull,
    int status_write
) {
    ::dup2(stdin_read, STDIN_FILENO);
    ::dup2(stdout_write, STDOUT_FILENO);
    if (devnull >= 0) {
        ::dup2(devnull, STDERR_FILENO);
    }

    // SIG_IGN survives exec; terminate() relies on a default SIGINT
    ::signal(SIGPIPE, SIG_DFL);
    ::signal(SIGINT, SIG_DFL);

    ::execvp(argv[0], argv);

    const int err = errno;
    [[maybe_unused]] const auto written = ::write(status_write, &err, sizeof(err));
    ::_exit(127);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Spawn
// ─────────────────────────────────────────────────────────────────────────────

ProcessResult<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const ProcessSpec& spec) {
    if (spec.program.empty()) {
        return tl::unexpected(ProcessError{"empty program", EINVAL});
    }

    // argv must exist before fork(): the child may not allocate
    std::vector<std::string> argv_storage;
    argv_storage.reserve(spec.args.size() + 1);
    argv_storage.push_back(spec.program);
    for (const auto& arg : spec.args) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    PipePair stdin_pipe;
    PipePair stdout_pipe;
    PipePair status_pipe;
    if (stdin_pipe.open() == false || stdout_pipe.open() == false || status_pipe.open() == false) {
        return tl::unexpected(make_error("failed to create pipes", errno));
    }

    int devnull = -1;
    if (spec.stderr_mode == StderrMode::Discard) {
        devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (devnull == -1) {
            return tl::unexpected(make_error("failed to open /dev/null", errno));
        }
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int err = errno;
        close_if_open(devnull);
        return tl::unexpected(make_error("fork failed", err));
    }

    if (pid == 0) {
        exec_child(argv.data(), stdin_pipe.read_end, stdout_pipe.write_end, devnull, status_pipe.write_end);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Parent
    // ─────────────────────────────────────────────────────────────────────────
    close_if_open(devnull);
    close_if_open(stdin_pipe.read_end);
    close_if_open(stdout_pipe.write_end);
    close_if_open(status_pipe.write_end);

    // EOF on the status pipe means exec succeeded (the write end was CLOEXEC)
    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe.read_end, &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        MCPLINK_LOG_WARN(kComponent, std::format("cannot execute '{}': {}", spec.program, std::strerror(exec_errno)));
        return tl::unexpected(make_error("cannot execute '" + spec.program + "'", exec_errno));
    }

    MCPLINK_LOG_INFO(kComponent, std::format("started '{}' (pid {})", spec.program, pid));

    return std::make_unique<ChildProcess>(
        ConstructionKey{},
        pid,
        stdin_pipe.take_write(),
        stdout_pipe.take_read(),
        spec.program
    );
}

ChildProcess::ChildProcess(ConstructionKey, pid_t pid, int stdin_fd, int stdout_fd, std::string program)
    : pid_(pid)
    , stdin_fd_(stdin_fd)
    , stdout_fd_(stdout_fd)
    , program_(std::move(program))
{}

ChildProcess::~ChildProcess() {
    close_if_open(stdin_fd_);
    close_if_open(stdout_fd_);
    if (auto result = terminate(); result.has_value() == false) {
        MCPLINK_LOG_WARN(kComponent, "terminate in destructor failed: " + result.error().message);
    }
}

int ChildProcess::release_stdin_fd() noexcept {
    std::lock_guard lock(mutex_);
    return std::exchange(stdin_fd_, -1);
}

int ChildProcess::release_stdout_fd() noexcept {
    std::lock_guard lock(mutex_);
    return std::exchange(stdout_fd_, -1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────────────────────────────────────

void ChildProcess::record_status(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool ChildProcess::is_alive() {
    std::lock_guard lock(mutex_);
    if (exit_code_.has_value()) {
        return false;
    }
    int status = 0;
    const pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        record_status(status);
        return false;
    }
    if (result == -1 && errno == ECHILD) {
        exit_code_ = -1;
        return false;
    }
    return true;
}

std::optional<int> ChildProcess::exit_code() const {
    std::lock_guard lock(mutex_);
    return exit_code_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Termination
// ─────────────────────────────────────────────────────────────────────────────

ProcessResult<int> ChildProcess::terminate(std::chrono::milliseconds grace) {
    std::lock_guard lock(mutex_);
    if (exit_code_.has_value()) {
        return *exit_code_;
    }

    if (::kill(pid_, SIGINT) == -1 && errno != ESRCH) {
        return tl::unexpected(make_error("failed to send SIGINT", errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (true) {
        int status = 0;
        const pid_t result = ::waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            record_status(status);
            MCPLINK_LOG_DEBUG(kComponent, std::format("'{}' exited with {}", program_, *exit_code_));
            return *exit_code_;
        }
        if (result == -1 && errno != EINTR) {
            const int err = errno;
            exit_code_ = -1;
            return tl::unexpected(make_error("waitpid failed", err));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(kExitPollInterval);
    }

    MCPLINK_LOG_WARN(kComponent, std::format("'{}' (pid {}) ignored SIGINT, sending SIGKILL", program_, pid_));
    if (::kill(pid_, SIGKILL) == -1 && errno != ESRCH) {
        return tl::unexpected(make_error("failed to send SIGKILL", errno));
    }

    int status = 0;
    pid_t result = -1;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result == -1 && errno == EINTR);

    if (result == -1) {
        const int err = errno;
        exit_code_ = -1;
        return tl::unexpected(make_error("waitpid failed", err));
    }
    record_status(status);
    return *exit_code_;
}

}  // namespace mcplink
