#pragma once

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ChildProcess is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mcplink {

// ═══════════════════════════════════════════════════════════════════════════
// Child Process
// ═══════════════════════════════════════════════════════════════════════════
// fork/exec with the child's stdin and stdout connected to pipes. The parent
// ends are created close-on-exec so sibling servers never inherit each
// other's pipes. An exec failure is reported synchronously by spawn() via a
// close-on-exec status pipe instead of surfacing later as an early EOF.

enum class StderrMode {
    Inherit,  ///< child writes to our stderr
    Discard   ///< /dev/null
};

struct ProcessSpec {
    std::string program;
    std::vector<std::string> args;
    StderrMode stderr_mode{StderrMode::Inherit};
};

struct ProcessError {
    std::string message;
    int error_number{0};  ///< errno of the failing call, 0 if none
};

template <typename T>
using ProcessResult = tl::expected<T, ProcessError>;

inline constexpr std::chrono::milliseconds DEFAULT_SHUTDOWN_GRACE{2000};

class ChildProcess {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /// Fork and exec. Fails if the pipes cannot be created, fork fails, or
    /// the program cannot be executed (not found, not executable, ...).
    [[nodiscard]] static ProcessResult<std::unique_ptr<ChildProcess>> spawn(const ProcessSpec& spec);

    /// Only reachable through spawn()
    ChildProcess(ConstructionKey, pid_t pid, int stdin_fd, int stdout_fd, std::string program);

    /// Terminates with DEFAULT_SHUTDOWN_GRACE if still running
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] const std::string& program() const noexcept { return program_; }

    /// Hand the parent end of the child's stdin/stdout to the caller; -1 once taken
    [[nodiscard]] int release_stdin_fd() noexcept;
    [[nodiscard]] int release_stdout_fd() noexcept;

    /// Non-blocking; reaps the child if it has exited
    [[nodiscard]] bool is_alive();

    /// Exit code once reaped; negative values are the terminating signal
    [[nodiscard]] std::optional<int> exit_code() const;

    /// SIGINT, wait up to `grace`, then SIGKILL and reap. Returns the exit
    /// code. Calling it again after the child has been reaped returns the
    /// recorded code without signalling anything.
    [[nodiscard]] ProcessResult<int> terminate(std::chrono::milliseconds grace = DEFAULT_SHUTDOWN_GRACE);

private:
    /// Called with mutex_ held
    void record_status(int status);

    pid_t pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    std::string program_;
    std::optional<int> exit_code_;
    mutable std::mutex mutex_;
};

}  // namespace mcplink
