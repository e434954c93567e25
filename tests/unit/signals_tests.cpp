#include <doctest/doctest.h>
#include <hookline/signals.hpp>

#include <csignal>
#include <stdexcept>
#include <string>
#include <vector>

using namespace hookline;

TEST_CASE("signal names are normalised") {
    CHECK(normalize_signal("INT") == "INT");
    CHECK(normalize_signal("sigint") == "INT");
    CHECK(normalize_signal("SIGTERM") == "TERM");
    CHECK(normalize_signal("2") == "INT");
    CHECK(normalize_signal("0") == "EXIT");
    CHECK(normalize_signal("exit") == "EXIT");
    CHECK_FALSE(normalize_signal("NOPE").has_value());
    CHECK_FALSE(normalize_signal("").has_value());

    CHECK(signal_number("EXIT") == SIGNAL_EXIT);
    CHECK(signal_number("USR1") == SIGUSR1);
}

TEST_CASE("handlers run most recent first") {
    SignalRegistry signals;
    std::vector<std::string> order;

    REQUIRE(signals.on("USR1", "a", [&](int) { order.push_back("a"); return 0; }).isOk());
    REQUIRE(signals.on("USR1", "b", [&](int) { order.push_back("b"); return 0; }).isOk());
    REQUIRE(signals.on("SIGUSR1", "c", [&](int) { order.push_back("c"); return 0; }).isOk());

    signals.dispatch("USR1");
    CHECK(order == std::vector<std::string>{"c", "b", "a"});
}

TEST_CASE("duplicate handler names are ignored unless allowed") {
    SignalRegistry signals;
    int calls = 0;
    auto count = [&](int) { ++calls; return 0; };

    signals.on("USR1", "h", count);
    signals.on("USR1", "h", count);
    signals.dispatch("USR1");
    CHECK(calls == 1);

    signals.on("USR1", "h", count, true);
    auto info = signals.list({"USR1"});
    REQUIRE(info.size() == 1);
    CHECK(info[0].handlers.size() == 2);

    signals.off("USR1", "h");
    CHECK(signals.list({"USR1"})[0].handlers.empty());
}

TEST_CASE("invalid registrations are rejected") {
    SignalRegistry signals;
    auto bad = signals.on("NOPE", "h", [](int) { return 0; });
    REQUIRE(bad.isErr());
    CHECK(bad.error().code() == ErrorCode::INVALID_SIGNAL);

    auto unnamed = signals.on("USR1", "", [](int) { return 0; });
    REQUIRE(unnamed.isErr());
    CHECK(unnamed.error().code() == ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE("a failing handler does not stop the others") {
    SignalRegistry signals;
    std::vector<std::string> order;

    signals.on("USR2", "first", [&](int) { order.push_back("first"); return 0; });
    signals.on("USR2", "throws", [&](int) -> int { throw std::runtime_error("boom"); });
    signals.on("USR2", "fails", [&](int) { order.push_back("fails"); return 3; });

    signals.dispatch("USR2");
    CHECK(order == std::vector<std::string>{"fails", "first"});
}

TEST_CASE("push and pop restore handler lists") {
    SignalRegistry signals;
    std::vector<std::string> order;

    signals.on("USR1", "outer", [&](int) { order.push_back("outer"); return 0; });
    signals.push();
    CHECK(signals.level() == 1);

    signals.on("USR1", "inner", [&](int) { order.push_back("inner"); return 0; });
    signals.dispatch("USR1");
    CHECK(order == std::vector<std::string>{"inner", "outer"});

    REQUIRE(signals.pop().isOk());
    CHECK(signals.level() == 0);

    order.clear();
    signals.dispatch("USR1");
    CHECK(order == std::vector<std::string>{"outer"});
}

TEST_CASE("selective pop only touches the listed signals") {
    SignalRegistry signals;
    signals.on("USR1", "one", [](int) { return 0; });
    signals.on("USR2", "two", [](int) { return 0; });

    signals.push({"USR1", "USR2"});
    signals.on("USR1", "one-more", [](int) { return 0; });
    signals.on("USR2", "two-more", [](int) { return 0; });

    REQUIRE(signals.pop({"USR1"}).isOk());
    CHECK(signals.list({"USR1"})[0].handlers == std::vector<std::string>{"one"});
    CHECK(signals.list({"USR2"})[0].handlers == std::vector<std::string>{"two", "two-more"});
}

TEST_CASE("pop on an empty stack fails") {
    SignalRegistry signals;
    auto popped = signals.pop();
    REQUIRE(popped.isErr());
    CHECK(popped.error().code() == ErrorCode::STACK_EMPTY);
}

TEST_CASE("clear keeps the signal active, restore forgets it") {
    SignalRegistry signals;
    signals.on("USR1", "h", [](int) { return 0; });
    CHECK(signals.active("USR1"));

    REQUIRE(signals.clear("USR1").isOk());
    CHECK(signals.active("USR1"));
    CHECK(signals.list({"USR1"})[0].handlers.empty());

    REQUIRE(signals.restore("USR1").isOk());
    CHECK_FALSE(signals.active("USR1"));

    auto again = signals.restore("USR1");
    REQUIRE(again.isErr());
    CHECK(again.error().code() == ErrorCode::NOT_FOUND);
}

TEST_CASE("raised signals are dispatched at the next safe point") {
    SignalRegistry signals;
    int seen = 0;
    signals.on("USR1", "count", [&](int signo) { seen = signo; return 0; });

    std::raise(SIGUSR1);
    CHECK(seen == 0);
    CHECK_FALSE(signals.pending().empty());

    signals.dispatch_pending();
    CHECK(seen == SIGUSR1);
    CHECK(signals.pending().empty());
}

TEST_CASE("legacy handler runs before registered handlers") {
    static std::vector<std::string> order;
    order.clear();

    auto previous = std::signal(SIGUSR2, [](int) { order.push_back("legacy"); });

    {
        SignalRegistry signals;
        signals.on("USR2", "mine", [](int) { order.push_back("mine"); return 0; });
        auto info = signals.list({"USR2"});
        REQUIRE(info.size() == 1);
        CHECK(info[0].has_legacy);

        signals.dispatch("USR2");
        CHECK(order == std::vector<std::string>{"legacy", "mine"});
    }

    std::signal(SIGUSR2, previous);
}

TEST_CASE("siginfo legacy handlers receive a signal record") {
    static volatile std::sig_atomic_t seen_signo = 0;
    static volatile std::sig_atomic_t seen_code = 0;

    struct sigaction action {};
    action.sa_sigaction = [](int, siginfo_t* info, void*) {
        seen_signo = info->si_signo;
        seen_code = info->si_code;
    };
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_SIGINFO;
    struct sigaction previous {};
    REQUIRE(::sigaction(SIGUSR1, &action, &previous) == 0);

    {
        SignalRegistry signals;
        int mine = 0;
        REQUIRE(signals.on("USR1", "mine", [&](int signo) { mine = signo; return 0; }).isOk());
        REQUIRE(signals.list({"USR1"})[0].has_legacy);

        SUBCASE("delivered") {
            std::raise(SIGUSR1);
            signals.dispatch_pending();
            CHECK(seen_signo == SIGUSR1);
            CHECK(mine == SIGUSR1);
        }
        SUBCASE("dispatched directly") {
            signals.dispatch("USR1");
            CHECK(seen_signo == SIGUSR1);
            CHECK(seen_code == SI_USER);
            CHECK(mine == SIGUSR1);
        }
    }

    ::sigaction(SIGUSR1, &previous, nullptr);
    seen_signo = 0;
    seen_code = 0;
}
