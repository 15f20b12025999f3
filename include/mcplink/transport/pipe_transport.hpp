#pragma once

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "PipeTransport is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "mcplink/transport.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace mcplink {

struct PipeTransportConfig {
    std::size_t max_frame_size{4 * 1024 * 1024};
};

// ═══════════════════════════════════════════════════════════════════════════
// PipeTransport
// ═══════════════════════════════════════════════════════════════════════════
// Newline-delimited JSON over a read fd (child stdout) and a write fd (child
// stdin). Takes ownership of both descriptors. Blank lines are skipped and a
// trailing '\r' is stripped. Both directions wait with poll() next to a
// private wake pipe, so close() and context cancellation interrupt them.

class PipeTransport final : public ITransport {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /// Fails only if the internal wake pipes cannot be created; the given
    /// descriptors are closed in that case.
    [[nodiscard]] static TransportResult<std::unique_ptr<PipeTransport>> create(
        int read_fd,
        int write_fd,
        PipeTransportConfig config = {}
    );

    /// Only reachable through create()
    PipeTransport(ConstructionKey, int read_fd, int write_fd, PipeTransportConfig config);

    ~PipeTransport() override;

    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;
    PipeTransport(PipeTransport&&) = delete;
    PipeTransport& operator=(PipeTransport&&) = delete;

    [[nodiscard]] TransportResult<void> send(const Context& ctx, std::string_view message) override;
    [[nodiscard]] TransportResult<std::string> receive(const Context& ctx) override;
    [[nodiscard]] TransportResult<void> close() override;

    [[nodiscard]] bool is_open() const noexcept override {
        return closed_.load(std::memory_order_acquire) == false;
    }

private:
    /// Self-pipe used to interrupt poll()
    class WakePipe {
    public:
        [[nodiscard]] bool open() noexcept;
        void notify() noexcept;
        void drain() noexcept;
        void close() noexcept;
        [[nodiscard]] int fd() const noexcept { return fds_[0]; }

    private:
        int fds_[2]{-1, -1};
    };

    enum class WaitOutcome { Ready, Closed, Cancelled, Failed };

    /// poll() `fd` for `events` until ready, closed, or ctx fires
    [[nodiscard]] WaitOutcome wait_for(int fd, short events, WakePipe& wake, const Context& ctx);

    [[nodiscard]] TransportResult<void> outcome_error(WaitOutcome outcome, const Context& ctx) const;

    /// Refill read_buffer_; called with read_mutex_ held
    [[nodiscard]] TransportResult<std::size_t> fill_read_buffer(const Context& ctx);

    [[nodiscard]] TransportResult<void> write_all(const Context& ctx, const char* data, std::size_t size);

    PipeTransportConfig config_;
    int read_fd_{-1};
    int write_fd_{-1};
    WakePipe read_wake_;
    WakePipe write_wake_;
    std::atomic<bool> closed_{false};
    bool eof_{false};

    std::mutex read_mutex_;
    std::mutex write_mutex_;

    static constexpr std::size_t read_buffer_size = 8192;
    char read_buffer_[read_buffer_size];
    std::size_t read_buffer_pos_{0};
    std::size_t read_buffer_len_{0};
    std::string partial_line_;
};

}  // namespace mcplink
