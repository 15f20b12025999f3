#include "mcplink/transport/pipe_transport.hpp"
#include "mcplink/log/logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <limits>
#include <mutex>
#include <optional>
#include <stop_token>

namespace mcplink {

namespace {

constexpr std::string_view kComponent = "transport";

std::string errno_message(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

// A dead reader must surface as EPIPE from write(), not kill the process
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] {
        ::signal(SIGPIPE, SIG_IGN);
    });
}

bool set_nonblocking(int fd) noexcept {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return false;
    }
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool is_blank(std::string_view line) noexcept {
    return std::all_of(line.begin(), line.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\r';
    });
}

int poll_timeout_ms(const Context& ctx) {
    const auto remaining = ctx.remaining();
    if (remaining.has_value() == false) {
        return -1;
    }
    const auto ms = std::chrono::ceil<std::chrono::milliseconds>(*remaining).count();
    return static_cast<int>(std::min<long long>(ms, std::numeric_limits<int>::max()));
}

void close_fd(int& fd, std::optional<TransportError>& first_error) {
    if (fd < 0) {
        return;
    }
    if (::close(fd) != 0 && errno != EINTR && first_error.has_value() == false) {
        first_error = TransportError::network(errno_message("close failed"));
    }
    fd = -1;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// WakePipe
// ─────────────────────────────────────────────────────────────────────────────

bool PipeTransport::WakePipe::open() noexcept {
    return ::pipe2(fds_, O_NONBLOCK | O_CLOEXEC) == 0;
}

void PipeTransport::WakePipe::notify() noexcept {
    if (fds_[1] < 0) {
        return;
    }
    const char byte = 1;
    // EAGAIN means the pipe is full, which already wakes the poller
    [[maybe_unused]] const auto written = ::write(fds_[1], &byte, 1);
}

void PipeTransport::WakePipe::drain() noexcept {
    char sink[64];
    while (::read(fds_[0], sink, sizeof(sink)) > 0) {
    }
}

void PipeTransport::WakePipe::close() noexcept {
    for (int& fd : fds_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::unique_ptr<PipeTransport>> PipeTransport::create(
    int read_fd,
    int write_fd,
    PipeTransportConfig config
) {
    ignore_sigpipe_once();

    auto transport = std::make_unique<PipeTransport>(ConstructionKey{}, read_fd, write_fd, config);

    const bool wake_ok = transport->read_wake_.open() && transport->write_wake_.open();
    if (wake_ok == false) {
        auto error = TransportError::network(errno_message("failed to create wake pipe"));
        if (auto closed = transport->close(); closed.has_value() == false) {
            MCPLINK_LOG_WARN(kComponent, "close after failed create: " + closed.error().message);
        }
        return tl::unexpected(std::move(error));
    }

    if (set_nonblocking(read_fd) == false || set_nonblocking(write_fd) == false) {
        auto error = TransportError::network(errno_message("failed to set O_NONBLOCK"));
        if (auto closed = transport->close(); closed.has_value() == false) {
            MCPLINK_LOG_WARN(kComponent, "close after failed create: " + closed.error().message);
        }
        return tl::unexpected(std::move(error));
    }

    return transport;
}

PipeTransport::PipeTransport(ConstructionKey, int read_fd, int write_fd, PipeTransportConfig config)
    : config_(config)
    , read_fd_(read_fd)
    , write_fd_(write_fd)
{}

PipeTransport::~PipeTransport() {
    if (auto result = close(); result.has_value() == false) {
        MCPLINK_LOG_WARN(kComponent, "close in destructor failed: " + result.error().message);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Waiting
// ─────────────────────────────────────────────────────────────────────────────

PipeTransport::WaitOutcome PipeTransport::wait_for(int fd, short events, WakePipe& wake, const Context& ctx) {
    std::stop_callback wake_on_stop(ctx.stop_token(), [&wake] { wake.notify(); });

    while (true) {
        if (closed_.load(std::memory_order_acquire)) {
            return WaitOutcome::Closed;
        }
        if (ctx.cancelled()) {
            return WaitOutcome::Cancelled;
        }

        pollfd fds[2]{};
        fds[0].fd = fd;
        fds[0].events = events;
        fds[1].fd = wake.fd();
        fds[1].events = POLLIN;

        const int rc = ::poll(fds, 2, poll_timeout_ms(ctx));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return WaitOutcome::Failed;
        }
        if (rc == 0) {
            continue;  // deadline re-checked at the top
        }

        if ((fds[1].revents & POLLIN) != 0) {
            // Leave the byte in place after close() so the other direction sees it too
            if (closed_.load(std::memory_order_acquire)) {
                return WaitOutcome::Closed;
            }
            wake.drain();
            continue;
        }
        if (fds[0].revents != 0) {
            return WaitOutcome::Ready;  // POLLHUP/POLLERR are reported by the next read/write
        }
    }
}

TransportResult<void> PipeTransport::outcome_error(WaitOutcome outcome, const Context& ctx) const {
    switch (outcome) {
        case WaitOutcome::Ready:
            return {};
        case WaitOutcome::Closed:
            return tl::unexpected(TransportError::closed("transport closed"));
        case WaitOutcome::Cancelled:
            return tl::unexpected(TransportError::from_context(ctx));
        case WaitOutcome::Failed:
            return tl::unexpected(TransportError::network(errno_message("poll failed")));
    }
    return tl::unexpected(TransportError::network("unknown wait outcome"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Send
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> PipeTransport::send(const Context& ctx, std::string_view message) {
    if (message.find('\n') != std::string_view::npos) {
        return tl::unexpected(TransportError::protocol("message contains a raw newline"));
    }

    std::string frame;
    frame.reserve(message.size() + 1);
    frame.append(message);
    frame.push_back('\n');

    std::lock_guard lock(write_mutex_);
    if (closed_.load(std::memory_order_acquire)) {
        return tl::unexpected(TransportError::closed("transport closed"));
    }
    return write_all(ctx, frame.data(), frame.size());
}

TransportResult<void> PipeTransport::write_all(const Context& ctx, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::write(write_fd_, data, size);
        if (written >= 0) {
            data += written;
            size -= static_cast<std::size_t>(written);
            continue;
        }

        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            const auto outcome = wait_for(write_fd_, POLLOUT, write_wake_, ctx);
            if (auto ready = outcome_error(outcome, ctx); ready.has_value() == false) {
                return ready;
            }
            continue;
        }
        if (errno == EPIPE) {
            return tl::unexpected(TransportError::closed("peer closed its input"));
        }
        return tl::unexpected(TransportError::network(errno_message("write failed")));
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Receive
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::size_t> PipeTransport::fill_read_buffer(const Context& ctx) {
    while (true) {
        const auto outcome = wait_for(read_fd_, POLLIN, read_wake_, ctx);
        if (auto ready = outcome_error(outcome, ctx); ready.has_value() == false) {
            return tl::unexpected(ready.error());
        }

        const ssize_t n = ::read(read_fd_, read_buffer_, read_buffer_size);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return tl::unexpected(TransportError::network(errno_message("read failed")));
        }

        read_buffer_pos_ = 0;
        read_buffer_len_ = static_cast<std::size_t>(n);
        if (n == 0) {
            eof_ = true;
        }
        return read_buffer_len_;
    }
}

TransportResult<std::string> PipeTransport::receive(const Context& ctx) {
    std::lock_guard lock(read_mutex_);

    while (true) {
        if (closed_.load(std::memory_order_acquire)) {
            return tl::unexpected(TransportError::closed("transport closed"));
        }

        while (read_buffer_pos_ < read_buffer_len_) {
            const char* start = read_buffer_ + read_buffer_pos_;
            const std::size_t available = read_buffer_len_ - read_buffer_pos_;
            const auto* newline = static_cast<const char*>(std::memchr(start, '\n', available));
            const std::size_t take = (newline != nullptr)
                ? static_cast<std::size_t>(newline - start)
                : available;

            if (partial_line_.size() + take > config_.max_frame_size) {
                partial_line_.clear();
                read_buffer_pos_ = read_buffer_len_;
                return tl::unexpected(TransportError::protocol(
                    "frame exceeds " + std::to_string(config_.max_frame_size) + " bytes"));
            }

            partial_line_.append(start, take);
            read_buffer_pos_ += take;
            if (newline == nullptr) {
                break;
            }
            ++read_buffer_pos_;

            std::string line = std::move(partial_line_);
            partial_line_.clear();
            if (line.empty() == false && line.back() == '\r') {
                line.pop_back();
            }
            if (is_blank(line)) {
                continue;
            }
            return line;
        }

        if (eof_) {
            // Unterminated final line
            if (is_blank(partial_line_) == false) {
                std::string line = std::move(partial_line_);
                partial_line_.clear();
                return line;
            }
            partial_line_.clear();
            return tl::unexpected(TransportError::closed("end of stream"));
        }

        auto filled = fill_read_buffer(ctx);
        if (filled.has_value() == false) {
            return tl::unexpected(filled.error());
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Close
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> PipeTransport::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return {};
    }

    read_wake_.notify();
    write_wake_.notify();

    std::optional<TransportError> first_error;
    {
        std::lock_guard lock(write_mutex_);
        close_fd(write_fd_, first_error);
        write_wake_.close();
    }
    {
        std::lock_guard lock(read_mutex_);
        close_fd(read_fd_, first_error);
        read_wake_.close();
    }

    MCPLINK_LOG_DEBUG(kComponent, "pipe transport closed");

    if (first_error.has_value()) {
        return tl::unexpected(std::move(*first_error));
    }
    return {};
}

}  // namespace mcplink
