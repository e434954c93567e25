#include "hookline/process.hpp"
#include "hookline/log.hpp"
#include "hookline/signals.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hookline {
namespace process {

namespace {

std::string errno_message(const std::string& what) {
    return what + " failed: " + std::strerror(errno);
}

struct CArgs {
    std::vector<std::string> storage;
    std::vector<char*> pointers;

    explicit CArgs(std::vector<std::string> values) : storage(std::move(values)) {
        for (auto& s : storage) {
            pointers.push_back(const_cast<char*>(s.c_str()));
        }
        pointers.push_back(nullptr);
    }

    char** data() { return pointers.data(); }
};

// Interval for re-checking a child that closed its streams but still runs
constexpr int kReapPollMs = 100;

} // namespace

// ============================================================================
// File Descriptors
// ============================================================================

Result<void> open_pipe(int fds[2]) {
    if (::pipe(fds) != 0) {
        return Result<void>::err(Error(ErrorCode::CAPTURE_FAILED, errno_message("pipe")));
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return Result<void>::ok();
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

// ============================================================================
// Spawning
// ============================================================================

Result<pid_t> spawn(const std::vector<std::string>& argv,
                    const Environment& env,
                    const std::vector<Redirect>& redirects) {
    if (argv.empty()) {
        return Result<pid_t>::err(Error(ErrorCode::INVALID_ARGUMENT, "empty command line"));
    }

    // Everything the child touches is prepared before fork
    CArgs c_argv(argv);
    CArgs c_envp(env.to_envp());

    pid_t pid = ::fork();

    if (pid == -1) {
        return Result<pid_t>::err(Error(ErrorCode::CAPTURE_FAILED, errno_message("fork")));
    }

    if (pid == 0) {
        // Child process
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);

        for (const auto& r : redirects) {
            if (r.parent_fd == r.child_fd) {
                ::fcntl(r.child_fd, F_SETFD, 0);
            } else if (::dup2(r.parent_fd, r.child_fd) == -1) {
                _exit(127);
            }
        }

        ::execve(c_argv.data()[0], c_argv.data(), c_envp.data());

        // If execve returns, it failed
        _exit(127);
    }

    log::modes().format("Spawned {} (pid {})", argv[0], pid);
    return Result<pid_t>::ok(pid);
}

Result<int> wait(pid_t pid, int done_fd, SignalRegistry* signals) {
    std::vector<int> forwarded;
    bool streams_done = done_fd < 0;
    int wakeup_fd = signals ? signal_wakeup_fd() : -1;
    int status = 0;

    auto forward_pending = [&]() {
        if (!signals) return;
        for (int signo : signals->pending()) {
            if (std::find(forwarded.begin(), forwarded.end(), signo) != forwarded.end()) {
                continue;
            }
            forwarded.push_back(signo);
            log::trap().format("Forwarding signal {} to pid {}", signo, pid);
            ::kill(pid, signo);
        }
    };

    while (true) {
        if (streams_done) {
            int flags = (wakeup_fd >= 0) ? WNOHANG : 0;
            pid_t r = ::waitpid(pid, &status, flags);
            if (r == pid) break;
            if (r == -1 && errno != EINTR) {
                return Result<int>::err(Error(ErrorCode::CAPTURE_FAILED, errno_message("waitpid")));
            }
            if (wakeup_fd < 0) continue;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (wakeup_fd >= 0) {
            fds[count++] = {wakeup_fd, POLLIN, 0};
        }
        int done_index = -1;
        if (!streams_done) {
            done_index = static_cast<int>(count);
            fds[count++] = {done_fd, POLLIN, 0};
        }

        int rc = ::poll(fds, count, streams_done ? kReapPollMs : -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return Result<int>::err(Error(ErrorCode::CAPTURE_FAILED, errno_message("poll")));
        }

        if (done_index >= 0 && (fds[done_index].revents & (POLLIN | POLLHUP))) {
            streams_done = true;
        }
        if (wakeup_fd >= 0 && (fds[0].revents & POLLIN)) {
            drain_signal_wakeup_fd();
            forward_pending();
        }
    }

    return Result<int>::ok(decode_status(status));
}

// ============================================================================
// Attached Execution
// ============================================================================

Result<AttachedResult> run_attached(const std::vector<std::string>& argv,
                                    const Environment& env,
                                    SignalRegistry* signals,
                                    int report_fd) {
    AttachedResult result;
    int report[2] = {-1, -1};
    std::vector<Redirect> redirects;

    if (report_fd >= 0) {
        auto piped = open_pipe(report);
        if (piped.isErr()) {
            return Result<AttachedResult>::err(piped.error());
        }
        redirects.push_back({report_fd, report[1]});
    }

    auto spawned = spawn(argv, env, redirects);
    close_fd(report[1]);
    if (spawned.isErr()) {
        close_fd(report[0]);
        return Result<AttachedResult>::err(spawned.error());
    }

    int done[2] = {-1, -1};
    std::thread reader;
    if (report[0] >= 0) {
        auto piped = open_pipe(done);
        if (piped.isErr()) {
            // Still reap the child; the report is lost
            close_fd(report[0]);
            auto waited = wait(spawned.value(), -1, signals);
            if (waited.isErr()) {
                return Result<AttachedResult>::err(waited.error());
            }
            return Result<AttachedResult>::err(piped.error());
        }

        reader = std::thread([&result, &report, &done]() {
            sigset_t all;
            sigfillset(&all);
            ::pthread_sigmask(SIG_BLOCK, &all, nullptr);

            char chunk[4096];
            while (true) {
                ssize_t n = ::read(report[0], chunk, sizeof(chunk));
                if (n > 0) {
                    result.report.append(chunk, static_cast<size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    break;
                }
            }
            char byte = 1;
            ssize_t ignored = ::write(done[1], &byte, 1);
            (void)ignored;
        });
    }

    auto waited = wait(spawned.value(), done[0], signals);

    if (reader.joinable()) {
        reader.join();
    }
    close_fd(report[0]);
    close_fd(done[0]);
    close_fd(done[1]);

    if (waited.isErr()) {
        return Result<AttachedResult>::err(waited.error());
    }
    result.exit_code = waited.value();
    return Result<AttachedResult>::ok(std::move(result));
}

std::string resolve_executable(const std::string& name, const Environment& env) {
    if (name.empty() || name.find('/') != std::string::npos) {
        return name;
    }

    std::string path = env.get("PATH").value_or("/usr/bin:/bin");
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";

        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return name;
}

} // namespace process
} // namespace hookline
