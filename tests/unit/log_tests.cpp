#include <doctest/doctest.h>
#include <hookline/log.hpp>

#include <algorithm>

using namespace hookline;

TEST_CASE("error and warn are on unless negated") {
    CHECK(log::filter_enables("", "error"));
    CHECK(log::filter_enables("", "warn"));
    CHECK_FALSE(log::filter_enables("", "hooks"));
    CHECK_FALSE(log::filter_enables("-warn", "warn"));
}

TEST_CASE("DEBUG filter selects tags") {
    CHECK(log::filter_enables("hooks,trap", "hooks"));
    CHECK(log::filter_enables("hooks, trap", "trap"));
    CHECK_FALSE(log::filter_enables("hooks,trap", "modes"));

    CHECK(log::filter_enables("*", "capture"));
    CHECK_FALSE(log::filter_enables("*,-trap", "trap"));
    CHECK_FALSE(log::filter_enables("-trap,*", "trap"));
}

TEST_CASE("configure re-evaluates existing channels") {
    log::hooks();
    log::trap();

    log::configure("hooks");
    CHECK(log::is_enabled("hooks"));
    CHECK_FALSE(log::is_enabled("trap"));
    CHECK(log::current_filter() == "hooks");

    log::configure("*,-hooks");
    CHECK_FALSE(log::is_enabled("hooks"));
    CHECK(log::is_enabled("trap"));

    log::configure("");
    CHECK_FALSE(log::is_enabled("trap"));
    CHECK(log::is_enabled("error"));
}

TEST_CASE("forced tags survive until the next configure") {
    log::configure("");
    log::enable("modes");
    CHECK(log::is_enabled("modes"));

    log::enable("warn", false);
    CHECK_FALSE(log::is_enabled("warn"));

    log::configure("");
    CHECK_FALSE(log::is_enabled("modes"));
    CHECK(log::is_enabled("warn"));
}

TEST_CASE("channels are created on first use") {
    log::channel("custom-tag");
    auto tags = log::tags();
    CHECK(std::find(tags.begin(), tags.end(), "custom-tag") != tags.end());
    CHECK(std::is_sorted(tags.begin(), tags.end()));
    CHECK(log::channel("custom-tag").tag() == "custom-tag");
}
