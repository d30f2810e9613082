#include "mcp/stdout_guard.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include "utils/debug_log.hpp"

namespace stdout_guard {

static std::atomic<bool> guard_active{false};

static nlohmann::json errno_fields(int error_number) {
    return nlohmann::json{{"errno", error_number}, {"error", std::strerror(error_number)}};
}

static bool is_blank(char byte) {
    return byte == ' ' || byte == '\t' || byte == '\r' || byte == '\n' || byte == '\f' || byte == '\v';
}

bool is_protocol_frame(const char *data, std::size_t count) {
    for (std::size_t offset = 0; offset < count; offset++) {
        if (!is_blank(data[offset])) {
            return data[offset] == '{' || data[offset] == '[';
        }
    }
    return false;
}

bool is_protocol_frame(const std::string &content) {
    return is_protocol_frame(content.data(), content.size());
}

FdWriteBuffer::FdWriteBuffer(int fd) : fd_(fd) {}

bool FdWriteBuffer::write_all(const char *data, std::size_t count) {
    while (count > 0) {
        ssize_t written = ::write(fd_, data, count);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += written;
        count -= static_cast<std::size_t>(written);
    }
    return true;
}

FdWriteBuffer::int_type FdWriteBuffer::overflow(int_type character) {
    if (traits_type::eq_int_type(character, traits_type::eof())) {
        return traits_type::not_eof(character);
    }
    char byte = traits_type::to_char_type(character);
    std::lock_guard<std::mutex> lock(mutex_);
    return write_all(&byte, 1) ? character : traits_type::eof();
}

std::streamsize FdWriteBuffer::xsputn(const char *data, std::streamsize count) {
    if (count <= 0) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return write_all(data, static_cast<std::size_t>(count)) ? count : 0;
}

FrameFilterBuffer::FrameFilterBuffer(std::streambuf *target) : target_(target) {}

std::streamsize FrameFilterBuffer::offer(const char *data, std::streamsize count) {
    if (!is_protocol_frame(data, static_cast<std::size_t>(count))) {
        discarded_writes_++;
        return count;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return target_->sputn(data, count);
}

FrameFilterBuffer::int_type FrameFilterBuffer::overflow(int_type character) {
    if (traits_type::eq_int_type(character, traits_type::eof())) {
        return traits_type::not_eof(character);
    }
    char byte = traits_type::to_char_type(character);
    return offer(&byte, 1) == 1 ? character : traits_type::eof();
}

std::streamsize FrameFilterBuffer::xsputn(const char *data, std::streamsize count) {
    if (count <= 0) {
        return 0;
    }
    return offer(data, count);
}

int FrameFilterBuffer::sync() {
    std::lock_guard<std::mutex> lock(mutex_);
    return target_->pubsync() == 0 ? 0 : -1;
}

std::size_t FrameFilterBuffer::discarded_write_count() const {
    return discarded_writes_.load();
}

ScopedStdoutGuard::ScopedStdoutGuard() {
    if (guard_active.exchange(true)) {
        throw std::logic_error("stdout guard is already installed");
    }
    std::cout.flush();
    std::fflush(stdout);

    int pipe_fds[2] = {-1, -1};
    saved_fd_ = ::dup(STDOUT_FILENO);
    if (saved_fd_ < 0 || ::pipe(pipe_fds) != 0) {
        int saved_errno = errno;
        release_descriptors();
        guard_active.store(false);
        throw std::system_error(saved_errno, std::generic_category(), "cannot create stdout pipe");
    }
    pipe_read_fd_ = pipe_fds[0];

    real_stdout_.reset(new FdWriteBuffer(saved_fd_));
    stream_filter_.reset(new FrameFilterBuffer(real_stdout_.get()));
    // The reader runs with SIGINT/SIGTERM blocked; they must reach the thread reading stdin.
    sigset_t shutdown_signals;
    sigset_t previous_mask;
    sigemptyset(&shutdown_signals);
    sigaddset(&shutdown_signals, SIGINT);
    sigaddset(&shutdown_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &shutdown_signals, &previous_mask);
    try {
        reader_ = std::thread(&ScopedStdoutGuard::reader_loop, this);
    } catch (const std::system_error &) {
        pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);
        ::close(pipe_fds[1]);
        release_descriptors();
        guard_active.store(false);
        throw;
    }
    pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);

    if (::dup2(pipe_fds[1], STDOUT_FILENO) < 0) {
        int saved_errno = errno;
        ::close(pipe_fds[1]);
        reader_.join();
        release_descriptors();
        guard_active.store(false);
        throw std::system_error(saved_errno, std::generic_category(), "cannot redirect stdout");
    }
    // Descriptor 1 is now the only write end of the pipe.
    ::close(pipe_fds[1]);

    original_ = std::cout.rdbuf(stream_filter_.get());
}

ScopedStdoutGuard::~ScopedStdoutGuard() {
    std::cout.flush();
    std::cout.rdbuf(original_);
    std::fflush(stdout);

    // Putting the real descriptor back closes the pipe's last write end, so the
    // reader drains what is left and sees EOF.
    if (::dup2(saved_fd_, STDOUT_FILENO) < 0) {
        debug_log::error("Cannot restore stdout descriptor", errno_fields(errno));
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    release_descriptors();
    guard_active.store(false);
}

void ScopedStdoutGuard::release_descriptors() {
    if (pipe_read_fd_ >= 0) {
        ::close(pipe_read_fd_);
        pipe_read_fd_ = -1;
    }
    if (saved_fd_ >= 0) {
        ::close(saved_fd_);
        saved_fd_ = -1;
    }
}

void ScopedStdoutGuard::reader_loop() {
    enum class LineState { Undecided, Forwarding, Dropping };
    LineState state = LineState::Undecided;
    std::string leading; // whitespace before the current line's first significant byte
    char buffer[4096];

    while (true) {
        ssize_t received = ::read(pipe_read_fd_, buffer, sizeof(buffer));
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            debug_log::error("stdout pipe read failed", errno_fields(errno));
            break;
        }
        if (received == 0) {
            break;
        }

        std::size_t run_start = 0;
        for (std::size_t offset = 0; offset < static_cast<std::size_t>(received); offset++) {
            char byte = buffer[offset];
            if (state == LineState::Undecided) {
                if (byte == '\n') {
                    leading.clear();
                    continue;
                }
                if (is_blank(byte)) {
                    leading.push_back(byte);
                    continue;
                }
                if (byte == '{' || byte == '[') {
                    state = LineState::Forwarding;
                    real_stdout_->sputn(leading.data(), static_cast<std::streamsize>(leading.size()));
                    run_start = offset;
                } else {
                    state = LineState::Dropping;
                    discarded_descriptor_lines_++;
                }
                leading.clear();
            }
            if (byte == '\n') {
                if (state == LineState::Forwarding) {
                    real_stdout_->sputn(buffer + run_start, static_cast<std::streamsize>(offset + 1 - run_start));
                }
                state = LineState::Undecided;
            }
        }
        if (state == LineState::Forwarding) {
            real_stdout_->sputn(buffer + run_start, static_cast<std::streamsize>(received) -
                                                    static_cast<std::streamsize>(run_start));
        }
    }
}

std::size_t ScopedStdoutGuard::discarded_count() const {
    return stream_filter_->discarded_write_count() + discarded_descriptor_lines_.load();
}

bool ScopedStdoutGuard::is_active() {
    return guard_active.load();
}

} // namespace stdout_guard
