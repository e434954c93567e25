#include "hookline/signals.hpp"
#include "hookline/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace hookline {

namespace {

struct SignalName {
    const char* name;
    int signo;
};

const SignalName kSignalTable[] = {
    {"HUP", SIGHUP},   {"INT", SIGINT},     {"QUIT", SIGQUIT}, {"ILL", SIGILL},
    {"TRAP", SIGTRAP}, {"ABRT", SIGABRT},   {"BUS", SIGBUS},   {"FPE", SIGFPE},
    {"USR1", SIGUSR1}, {"SEGV", SIGSEGV},   {"USR2", SIGUSR2}, {"PIPE", SIGPIPE},
    {"ALRM", SIGALRM}, {"TERM", SIGTERM},   {"CHLD", SIGCHLD}, {"CONT", SIGCONT},
    {"TSTP", SIGTSTP}, {"TTIN", SIGTTIN},   {"TTOU", SIGTTOU}, {"WINCH", SIGWINCH},
};

volatile std::sig_atomic_t g_pending[NSIG] = {};
volatile std::sig_atomic_t g_has_info[NSIG] = {};
// A second arrival of these escalates to the default action
volatile std::sig_atomic_t g_escalate[NSIG] = {};
siginfo_t g_info[NSIG];
int g_wakeup_pipe[2] = {-1, -1};
std::atomic<SignalRegistry*> g_exit_owner{nullptr};
std::once_flag g_atexit_once;
std::once_flag g_wakeup_once;

extern "C" void os_dispatcher(int signo, siginfo_t* info, void*) {
    if (signo <= 0 || signo >= NSIG) return;

    if (g_pending[signo] && g_escalate[signo]) {
        // Not dispatched yet: take the default action now
        struct sigaction dfl {};
        dfl.sa_handler = SIG_DFL;
        sigemptyset(&dfl.sa_mask);
        ::sigaction(signo, &dfl, nullptr);
        ::raise(signo);
        return;
    }

    if (info) {
        g_info[signo] = *info;
        g_has_info[signo] = 1;
    }
    g_pending[signo] = 1;

    if (g_wakeup_pipe[1] >= 0) {
        int saved = errno;
        char byte = static_cast<char>(signo);
        ssize_t ignored = ::write(g_wakeup_pipe[1], &byte, 1);
        (void)ignored;
        errno = saved;
    }
}

void open_wakeup_pipe() {
    if (::pipe(g_wakeup_pipe) != 0) {
        g_wakeup_pipe[0] = g_wakeup_pipe[1] = -1;
        return;
    }
    for (int fd : g_wakeup_pipe) {
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

const char* name_for(int signo) {
    for (const auto& entry : kSignalTable) {
        if (entry.signo == signo) return entry.name;
    }
    return nullptr;
}

bool is_terminating(int signo) {
    return signo == SIGINT || signo == SIGTERM || signo == SIGHUP || signo == SIGQUIT;
}

bool is_default_action(const struct sigaction& action) {
    return (action.sa_flags & SA_SIGINFO) == 0 && action.sa_handler == SIG_DFL;
}

} // namespace

int signal_wakeup_fd() {
    std::call_once(g_wakeup_once, open_wakeup_pipe);
    return g_wakeup_pipe[0];
}

void drain_signal_wakeup_fd() {
    int fd = signal_wakeup_fd();
    if (fd < 0) return;
    char buffer[64];
    while (::read(fd, buffer, sizeof(buffer)) > 0) {
    }
}

std::optional<std::string> normalize_signal(const std::string& input) {
    if (input == "0") {
        return std::string("EXIT");
    }

    if (is_number(input)) {
        int signo = std::atoi(input.c_str());
        if (const char* name = name_for(signo)) {
            return std::string(name);
        }
        return std::nullopt;
    }

    std::string upper = to_upper(input);
    if (upper.rfind("SIG", 0) == 0) {
        upper = upper.substr(3);
    }
    if (upper == "EXIT") {
        return upper;
    }
    for (const auto& entry : kSignalTable) {
        if (upper == entry.name) return upper;
    }
    return std::nullopt;
}

std::optional<int> signal_number(const std::string& name) {
    auto normalized = normalize_signal(name);
    if (!normalized) return std::nullopt;
    if (*normalized == "EXIT") return SIGNAL_EXIT;
    for (const auto& entry : kSignalTable) {
        if (*normalized == entry.name) return entry.signo;
    }
    return std::nullopt;
}

// ============================================================================
// SignalRegistry
// ============================================================================

SignalRegistry::SignalRegistry() {
    signal_wakeup_fd();
}

SignalRegistry::~SignalRegistry() {
    for (auto& [name, record] : records_) {
        release(name, record);
    }
    records_.clear();
}

SignalRegistry::SignalRecord& SignalRegistry::initialize(const std::string& signal, int signo) {
    SignalRecord& record = records_[signal];
    record.signo = signo;

    if (signo == SIGNAL_EXIT) {
        // Statics used during EXIT dispatch must exist before the trampoline
        // is registered, or they are destroyed before it runs
        log::trap();
        log::hooks();
        std::call_once(g_atexit_once, [] { std::atexit(&SignalRegistry::exit_trampoline); });
        g_exit_owner.store(this);
        log::trap().format("Initialized signal: {}", signal);
        return record;
    }

    struct sigaction action {};
    action.sa_sigaction = os_dispatcher;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_SIGINFO;
    // Blocking calls in the coordinator return EINTR on an interrupt
    if (!is_terminating(signo)) {
        action.sa_flags |= SA_RESTART;
    }

    if (::sigaction(signo, &action, &record.legacy) != 0) {
        log::error().format("cannot install dispatcher for {}: {}", signal, std::strerror(errno));
        records_.erase(signal);
        throw std::system_error(errno, std::generic_category(), "sigaction");
    }

    bool is_siginfo = (record.legacy.sa_flags & SA_SIGINFO) != 0;
    if (is_siginfo) {
        record.has_legacy = record.legacy.sa_sigaction != nullptr &&
                            record.legacy.sa_sigaction != os_dispatcher;
    } else {
        record.has_legacy = record.legacy.sa_handler != SIG_DFL &&
                            record.legacy.sa_handler != SIG_IGN;
    }
    g_escalate[signo] = is_terminating(signo) && is_default_action(record.legacy);

    if (record.has_legacy) {
        log::trap().format("Captured legacy handler for {}", signal);
    }
    log::trap().format("Initialized signal: {}", signal);
    return record;
}

void SignalRegistry::release(const std::string& signal, SignalRecord& record) {
    if (record.signo == SIGNAL_EXIT) {
        SignalRegistry* self = this;
        g_exit_owner.compare_exchange_strong(self, nullptr);
        return;
    }
    g_escalate[record.signo] = 0;
    if (::sigaction(record.signo, &record.legacy, nullptr) != 0) {
        log::error().format("cannot restore disposition for {}: {}", signal, std::strerror(errno));
    }
}

Result<void> SignalRegistry::on(const std::string& signal, const std::string& name,
                                SignalCallback callback, bool allow_duplicates) {
    auto normalized = normalize_signal(signal);
    if (!normalized) {
        return Result<void>::err(Error(ErrorCode::INVALID_SIGNAL, "unknown signal: " + signal));
    }
    if (name.empty() || !callback) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                       "signal handler requires a name and a callable"));
    }

    auto it = records_.find(*normalized);
    if (it == records_.end()) {
        try {
            initialize(*normalized, *signal_number(*normalized));
        } catch (const std::system_error& e) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, e.what()));
        }
        it = records_.find(*normalized);
    }

    auto& handlers = it->second.handlers;
    bool present = std::any_of(handlers.begin(), handlers.end(),
                               [&](const SignalHandler& h) { return h.name == name; });

    if (present && !allow_duplicates) {
        log::trap().format("Handler already registered: {} for {} (duplicates not allowed)",
                           name, *normalized);
        return Result<void>::ok();
    }

    handlers.push_back({name, std::move(callback)});
    log::trap().format("Handler registered{}: {} for {}",
                       present ? " (duplicate)" : "", name, *normalized);
    return Result<void>::ok();
}

Result<void> SignalRegistry::off(const std::string& signal, const std::string& name) {
    auto normalized = normalize_signal(signal);
    if (!normalized) {
        return Result<void>::err(Error(ErrorCode::INVALID_SIGNAL, "unknown signal: " + signal));
    }

    auto it = records_.find(*normalized);
    if (it == records_.end()) {
        log::trap().format("No handlers registered for signal: {}", *normalized);
        return Result<void>::ok();
    }

    auto& handlers = it->second.handlers;
    handlers.erase(std::remove_if(handlers.begin(), handlers.end(),
                                  [&](const SignalHandler& h) { return h.name == name; }),
                   handlers.end());
    log::trap().format("Handler removed: {} from {}", name, *normalized);
    return Result<void>::ok();
}

void SignalRegistry::run_legacy(const SignalRecord& record) noexcept {
    if (!record.has_legacy) return;

    log::trap().line("  -> Executing legacy handler");
    if (record.legacy.sa_flags & SA_SIGINFO) {
        // Delivered signals carry what the kernel reported; a direct
        // dispatch gets a record describing a signal sent by this process
        siginfo_t info;
        if (g_has_info[record.signo]) {
            info = g_info[record.signo];
        } else {
            std::memset(&info, 0, sizeof(info));
            info.si_signo = record.signo;
            info.si_code = SI_USER;
            info.si_pid = ::getpid();
            info.si_uid = ::getuid();
        }
        record.legacy.sa_sigaction(record.signo, &info, nullptr);
    } else {
        record.legacy.sa_handler(record.signo);
    }
}

void SignalRegistry::dispatch(const std::string& signal) noexcept {
    try {
        auto normalized = normalize_signal(signal);
        if (!normalized) {
            log::error().format("cannot dispatch unknown signal '{}'", signal);
            return;
        }

        auto it = records_.find(*normalized);
        if (it == records_.end()) {
            log::trap().format("No handlers registered for signal: {}", *normalized);
            return;
        }

        log::trap().format("Dispatching trap for {}", *normalized);
        run_legacy(it->second);

        // Handlers may register or remove handlers while running
        std::vector<SignalHandler> handlers = it->second.handlers;
        int signo = it->second.signo;

        for (auto h = handlers.rbegin(); h != handlers.rend(); ++h) {
            log::trap().format("  -> Executing: {}", h->name);
            try {
                int rc = h->callback(signo);
                if (rc != 0) {
                    log::trap().format("Handler failed: {} (exit code: {})", h->name, rc);
                }
            } catch (const std::exception& e) {
                log::error().format("signal handler '{}' failed: {}", h->name, e.what());
            } catch (...) {
                log::error().format("signal handler '{}' failed with unknown exception", h->name);
            }
        }
    } catch (const std::exception& e) {
        // Logging itself failed; cleanup must continue
        std::fprintf(stderr, "[trap] dispatch of %s aborted: %s\n", signal.c_str(), e.what());
    }
}

std::vector<int> SignalRegistry::pending() const {
    std::vector<int> result;
    for (int signo = 1; signo < NSIG; ++signo) {
        if (g_pending[signo]) result.push_back(signo);
    }
    return result;
}

void SignalRegistry::dispatch_pending() noexcept {
    drain_signal_wakeup_fd();

    for (int signo = 1; signo < NSIG; ++signo) {
        if (!g_pending[signo]) continue;
        g_pending[signo] = 0;

        const char* name = name_for(signo);
        if (!name) continue;
        std::string signal(name);

        auto it = records_.find(signal);
        if (it == records_.end()) continue;

        dispatch(signal);
        g_has_info[signo] = 0;
        terminate_if_fatal(signal, signo);
    }
}

void SignalRegistry::terminate_if_fatal(const std::string& signal, int signo) {
    if (exiting_ || !is_terminating(signo)) return;

    auto it = records_.find(signal);
    if (it == records_.end()) return;

    if (!is_default_action(it->second.legacy)) return;

    log::trap().format("{} terminates the process (exit code: {})", signal, 128 + signo);
    exit(128 + signo);
}

void SignalRegistry::guard_termination() {
    for (const char* signal : {"INT", "TERM", "HUP", "QUIT"}) {
        if (records_.count(signal) == 0) {
            try {
                initialize(signal, *signal_number(signal));
            } catch (const std::system_error& e) {
                log::error().format("cannot guard {}: {}", signal, e.what());
            }
        }
    }
}

void SignalRegistry::push(const std::vector<std::string>& signals) {
    Snapshot snapshot;

    if (signals.empty()) {
        for (const auto& [name, record] : records_) {
            snapshot[name] = record.handlers;
        }
    } else {
        for (const auto& raw : signals) {
            auto normalized = normalize_signal(raw);
            if (!normalized) {
                log::error().format("ignoring unknown signal '{}' in push", raw);
                continue;
            }
            auto it = records_.find(*normalized);
            snapshot[*normalized] = (it != records_.end()) ? it->second.handlers
                                                           : std::vector<SignalHandler>{};
        }
    }

    stack_.push_back(std::move(snapshot));
    log::trap().format("Trap state pushed (level: {})", stack_.size());
}

Result<void> SignalRegistry::pop(const std::vector<std::string>& signals) {
    if (stack_.empty()) {
        return Result<void>::err(Error(ErrorCode::STACK_EMPTY, "no trap state to pop"));
    }

    std::vector<std::string> filter;
    for (const auto& raw : signals) {
        if (auto normalized = normalize_signal(raw)) {
            filter.push_back(*normalized);
        }
    }

    Snapshot snapshot = std::move(stack_.back());
    stack_.pop_back();

    for (auto& [name, handlers] : snapshot) {
        if (!filter.empty() && std::find(filter.begin(), filter.end(), name) == filter.end()) {
            continue;
        }
        auto it = records_.find(name);
        if (it == records_.end()) {
            try {
                initialize(name, *signal_number(name));
            } catch (const std::system_error& e) {
                log::error().format("cannot restore {}: {}", name, e.what());
                continue;
            }
            it = records_.find(name);
        }
        it->second.handlers = std::move(handlers);
    }

    log::trap().format("Trap state popped (level: {})", stack_.size());
    return Result<void>::ok();
}

Result<void> SignalRegistry::clear(const std::string& signal) {
    auto normalized = normalize_signal(signal);
    if (!normalized) {
        return Result<void>::err(Error(ErrorCode::INVALID_SIGNAL, "unknown signal: " + signal));
    }
    auto it = records_.find(*normalized);
    if (it != records_.end()) {
        it->second.handlers.clear();
        log::trap().format("Cleared all handlers for {}", *normalized);
    }
    return Result<void>::ok();
}

Result<void> SignalRegistry::restore(const std::string& signal) {
    auto normalized = normalize_signal(signal);
    if (!normalized) {
        return Result<void>::err(Error(ErrorCode::INVALID_SIGNAL, "unknown signal: " + signal));
    }
    auto it = records_.find(*normalized);
    if (it == records_.end()) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND,
                                       "no trap installed for signal: " + *normalized));
    }

    release(it->first, it->second);
    records_.erase(it);
    log::trap().format("Restored original trap for {}", *normalized);
    return Result<void>::ok();
}

std::vector<SignalInfo> SignalRegistry::list(const std::vector<std::string>& signals) const {
    std::vector<SignalInfo> result;

    auto describe = [&](const std::string& name, const SignalRecord& record) {
        SignalInfo info;
        info.signal = name;
        info.has_legacy = record.has_legacy;
        for (const auto& h : record.handlers) {
            info.handlers.push_back(h.name);
        }
        result.push_back(std::move(info));
    };

    if (signals.empty()) {
        for (const auto& [name, record] : records_) {
            describe(name, record);
        }
        return result;
    }

    for (const auto& raw : signals) {
        auto normalized = normalize_signal(raw);
        if (!normalized) continue;
        auto it = records_.find(*normalized);
        if (it != records_.end()) {
            describe(it->first, it->second);
        }
    }
    return result;
}

bool SignalRegistry::active(const std::string& signal) const {
    auto normalized = normalize_signal(signal);
    return normalized && records_.count(*normalized) > 0;
}

void SignalRegistry::exit(int status) {
    exit_status_ = status;
    if (exiting_) {
        // Already inside EXIT dispatch; exit() may not be re-entered
        std::fflush(nullptr);
        std::_Exit(status);
    }
    exiting_ = true;
    std::exit(status);
}

void SignalRegistry::exit_trampoline() {
    SignalRegistry* owner = g_exit_owner.exchange(nullptr);
    if (owner) {
        owner->exiting_ = true;
        owner->dispatch("EXIT");
    }
}

} // namespace hookline
