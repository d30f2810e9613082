#ifndef CRMCPS_STDOUT_GUARD_HPP
#define CRMCPS_STDOUT_GUARD_HPP

// Protocol-safe stdout.
//
// stdout carries JSON-RPC frames only; a single stray byte from a library
// would corrupt the stream for the rest of the session. The check is
// structural: content whose first non-whitespace byte is '{' or '[' is
// forwarded unmodified, anything else is dropped.
//
// ScopedStdoutGuard covers both ways of reaching stdout:
//  - std::cout gets a FrameFilterBuffer, which judges every write on its own.
//    Writes are never joined, so a fragment left by one writer can neither
//    swallow nor pollute the next frame.
//  - File descriptor 1 (printf, puts, write(1, ...)) is pointed at a pipe.
//    A reader thread judges that byte stream line by line, at each line's
//    first non-whitespace byte, and copies accepted lines to the real stdout.
// Both paths end in one FdWriteBuffer on a saved duplicate of the real
// descriptor. Only one guard may be active per process.

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <streambuf>
#include <string>
#include <thread>

namespace stdout_guard {

// True if content looks like a protocol frame: first non-whitespace byte is '{' or '['.
bool is_protocol_frame(const char *data, std::size_t count);
bool is_protocol_frame(const std::string &content);

// Unbuffered streambuf writing straight to a file descriptor. Each sputn is
// written completely (retrying on EINTR) under a mutex, so concurrent callers
// never interleave within one write. Does not own the descriptor.
class FdWriteBuffer : public std::streambuf {
public:
    explicit FdWriteBuffer(int fd);

protected:
    int_type overflow(int_type character) override;
    std::streamsize xsputn(const char *data, std::streamsize count) override;

private:
    bool write_all(const char *data, std::size_t count);

    int fd_;
    std::mutex mutex_;
};

// Unbuffered streambuf decorator. Every write reaching it (one sputn, or one
// character through overflow) is forwarded whole to target if it passes
// is_protocol_frame, and dropped whole otherwise.
class FrameFilterBuffer : public std::streambuf {
public:
    // target is the unwrapped buffer; it is never std::cout's current buffer after installation.
    explicit FrameFilterBuffer(std::streambuf *target);

    std::size_t discarded_write_count() const;

protected:
    int_type overflow(int_type character) override;
    std::streamsize xsputn(const char *data, std::streamsize count) override;
    int sync() override;

private:
    std::streamsize offer(const char *data, std::streamsize count);

    std::streambuf *target_;
    std::atomic<std::size_t> discarded_writes_{0};
    std::mutex mutex_;
};

class ScopedStdoutGuard {
public:
    // Throws std::logic_error if another guard is already active, and
    // std::system_error if descriptor 1 cannot be redirected.
    ScopedStdoutGuard();
    ~ScopedStdoutGuard();

    ScopedStdoutGuard(const ScopedStdoutGuard &) = delete;
    ScopedStdoutGuard &operator=(const ScopedStdoutGuard &) = delete;

    // Writes dropped from std::cout plus lines dropped from descriptor 1.
    std::size_t discarded_count() const;

    static bool is_active();

private:
    void reader_loop();
    void release_descriptors();

    int saved_fd_ = -1;
    int pipe_read_fd_ = -1;
    std::streambuf *original_ = nullptr;
    std::unique_ptr<FdWriteBuffer> real_stdout_;
    std::unique_ptr<FrameFilterBuffer> stream_filter_;
    std::atomic<std::size_t> discarded_descriptor_lines_{0};
    std::thread reader_;
};

} // namespace stdout_guard

#endif // CRMCPS_STDOUT_GUARD_HPP
