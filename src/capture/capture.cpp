#include "hookline/capture.hpp"
#include "hookline/log.hpp"
#include "hookline/process.hpp"
#include "hookline/signals.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

namespace hookline {

namespace {

/**
 * Two reader threads that drain the read ends of a stdout and a stderr
 * pipe into one buffer. The done descriptor becomes readable once both
 * streams reached end of file.
 */
class LineCollector {
public:
    explicit LineCollector(CaptureBuffer& buffer) : buffer_(buffer) {}

    ~LineCollector() {
        join();
        process::close_fd(done_[0]);
        process::close_fd(done_[1]);
    }

    LineCollector(const LineCollector&) = delete;
    LineCollector& operator=(const LineCollector&) = delete;

    // Takes ownership of both descriptors
    Result<void> start(int out_fd, int err_fd) {
        auto piped = process::open_pipe(done_);
        if (piped.isErr()) {
            ::close(out_fd);
            ::close(err_fd);
            return piped;
        }
        out_ = std::thread(&LineCollector::pump, this, out_fd, StreamTag::Stdout);
        err_ = std::thread(&LineCollector::pump, this, err_fd, StreamTag::Stderr);
        return Result<void>::ok();
    }

    int done_fd() const { return done_[0]; }

    void join() {
        if (out_.joinable()) out_.join();
        if (err_.joinable()) err_.join();
    }

private:
    void pump(int fd, StreamTag tag) {
        // Signals belong to the coordinator thread
        sigset_t all;
        sigfillset(&all);
        ::pthread_sigmask(SIG_BLOCK, &all, nullptr);

        std::string pending;
        char chunk[4096];
        while (true) {
            ssize_t n = ::read(fd, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;

            pending.append(chunk, static_cast<size_t>(n));
            size_t start = 0;
            size_t nl;
            while ((nl = pending.find('\n', start)) != std::string::npos) {
                append(tag, pending.substr(start, nl - start));
                start = nl + 1;
            }
            pending.erase(0, start);
        }

        // Final line without a newline
        if (!pending.empty()) {
            append(tag, pending);
        }
        ::close(fd);

        if (--remaining_ == 0) {
            char byte = 1;
            ssize_t ignored = ::write(done_[1], &byte, 1);
            (void)ignored;
        }
    }

    void append(StreamTag tag, std::string text) {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.lines.push_back({tag, std::move(text)});
    }

    CaptureBuffer& buffer_;
    std::mutex mutex_;
    std::atomic<int> remaining_{2};
    int done_[2] = {-1, -1};
    std::thread out_;
    std::thread err_;
};

void flush_standard_streams() {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
}

// Puts the saved stdout/stderr back when it goes out of scope
class StdioRestore {
public:
    StdioRestore(int saved_out, int saved_err) : saved_out_(saved_out), saved_err_(saved_err) {}
    ~StdioRestore() { restore(); }

    StdioRestore(const StdioRestore&) = delete;
    StdioRestore& operator=(const StdioRestore&) = delete;

    void restore() {
        if (saved_out_ < 0 && saved_err_ < 0) return;
        flush_standard_streams();
        if (saved_out_ >= 0) ::dup2(saved_out_, STDOUT_FILENO);
        if (saved_err_ >= 0) ::dup2(saved_err_, STDERR_FILENO);
        process::close_fd(saved_out_);
        process::close_fd(saved_err_);
    }

private:
    int saved_out_;
    int saved_err_;
};

Error capture_error(const std::string& what) {
    return Error(ErrorCode::CAPTURE_FAILED, what + " failed: " + std::strerror(errno));
}

} // namespace

std::vector<std::string> CaptureBuffer::stdout_lines() const {
    std::vector<std::string> result;
    for (const auto& line : lines) {
        if (line.stream == StreamTag::Stdout) result.push_back(line.text);
    }
    return result;
}

std::vector<std::string> CaptureBuffer::stderr_lines() const {
    std::vector<std::string> result;
    for (const auto& line : lines) {
        if (line.stream == StreamTag::Stderr) result.push_back(line.text);
    }
    return result;
}

std::string capture_buffer_name(const std::string& hook, uint64_t seq) {
    return "__" + to_slug(hook, '_', 40) + "_" + std::to_string(seq);
}

std::string CaptureHarness::next_name(const std::string& hook) {
    ++seq_;
    return capture_buffer_name(hook, seq_);
}

// ============================================================================
// In-process functions
// ============================================================================

Result<Capture> CaptureHarness::run_function(const std::string& hook,
                                             const std::function<int()>& fn) {
    Capture capture;
    capture.buffer.name = next_name(hook);

    int out[2] = {-1, -1};
    int err[2] = {-1, -1};
    auto piped = process::open_pipe(out);
    if (piped.isOk()) {
        piped = process::open_pipe(err);
        if (piped.isErr()) {
            process::close_fd(out[0]);
            process::close_fd(out[1]);
        }
    }
    if (piped.isErr()) {
        return Result<Capture>::err(piped.error());
    }

    log::capture().format("Capturing {} into {}", hook, capture.buffer.name);
    flush_standard_streams();

    int saved_out = ::fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 0);
    int saved_err = ::fcntl(STDERR_FILENO, F_DUPFD_CLOEXEC, 0);
    if (saved_out < 0 || saved_err < 0) {
        Error e = capture_error("dup");
        process::close_fd(saved_out);
        process::close_fd(saved_err);
        for (int* fd : {&out[0], &out[1], &err[0], &err[1]}) process::close_fd(*fd);
        return Result<Capture>::err(e);
    }

    // The collector outlives the restore guard: readers only see end of
    // file once the original descriptors are back
    LineCollector collector(capture.buffer);
    StdioRestore stdio(saved_out, saved_err);

    if (::dup2(out[1], STDOUT_FILENO) == -1 || ::dup2(err[1], STDERR_FILENO) == -1) {
        Error e = capture_error("dup2");
        stdio.restore();
        for (int* fd : {&out[0], &out[1], &err[0], &err[1]}) process::close_fd(*fd);
        return Result<Capture>::err(e);
    }
    process::close_fd(out[1]);
    process::close_fd(err[1]);

    auto started = collector.start(out[0], err[0]);
    if (started.isErr()) {
        return Result<Capture>::err(started.error());
    }

    std::optional<std::string> failure;
    try {
        capture.exit_code = fn();
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown exception";
    }

    stdio.restore();
    collector.join();

    if (failure) {
        capture.buffer.lines.push_back({StreamTag::Stderr, "hook function failed: " + *failure});
        capture.exit_code = 1;
    }
    log::capture().format("Captured {} lines from {} (exit code: {})",
                          capture.buffer.lines.size(), hook, capture.exit_code);
    return Result<Capture>::ok(std::move(capture));
}

// ============================================================================
// Subprocesses
// ============================================================================

Result<Capture> CaptureHarness::run_process(const std::string& hook,
                                            const std::vector<std::string>& argv,
                                            const Environment& env) {
    Capture capture;
    capture.buffer.name = next_name(hook);

    int out[2] = {-1, -1};
    int err[2] = {-1, -1};
    auto piped = process::open_pipe(out);
    if (piped.isOk()) {
        piped = process::open_pipe(err);
        if (piped.isErr()) {
            process::close_fd(out[0]);
            process::close_fd(out[1]);
        }
    }
    if (piped.isErr()) {
        return Result<Capture>::err(piped.error());
    }

    LineCollector collector(capture.buffer);
    auto started = collector.start(out[0], err[0]);
    if (started.isErr()) {
        process::close_fd(out[1]);
        process::close_fd(err[1]);
        return Result<Capture>::err(started.error());
    }

    log::capture().format("Capturing {} into {}", hook, capture.buffer.name);

    flush_standard_streams();
    auto spawned = process::spawn(argv, env, {{STDOUT_FILENO, out[1]}, {STDERR_FILENO, err[1]}});

    // The child holds the write ends now
    process::close_fd(out[1]);
    process::close_fd(err[1]);

    if (spawned.isErr()) {
        collector.join();
        return Result<Capture>::err(spawned.error());
    }

    auto waited = process::wait(spawned.value(), collector.done_fd(), signals_);
    collector.join();

    if (waited.isErr()) {
        return Result<Capture>::err(waited.error());
    }

    capture.exit_code = waited.value();
    log::capture().format("Captured {} lines from {} (exit code: {})",
                          capture.buffer.lines.size(), hook, capture.exit_code);
    return Result<Capture>::ok(std::move(capture));
}

} // namespace hookline
