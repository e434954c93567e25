#include <doctest/doctest.h>
#include <hookline/types.hpp>

using namespace hookline;

TEST_CASE("hook names allow alphanumerics, underscore and dash") {
    CHECK(is_valid_hook_name("build"));
    CHECK(is_valid_hook_name("pre-deploy"));
    CHECK(is_valid_hook_name("post_test_2"));

    CHECK_FALSE(is_valid_hook_name(""));
    CHECK_FALSE(is_valid_hook_name("bad name"));
    CHECK_FALSE(is_valid_hook_name("a.b"));
    CHECK_FALSE(is_valid_hook_name("x/y"));
    CHECK_FALSE(is_valid_hook_name("hook:run"));
}

TEST_CASE("env names follow the shell identifier rule") {
    CHECK(is_valid_env_name("PATH"));
    CHECK(is_valid_env_name("_private"));
    CHECK(is_valid_env_name("A1_B2"));

    CHECK_FALSE(is_valid_env_name(""));
    CHECK_FALSE(is_valid_env_name("1ABC"));
    CHECK_FALSE(is_valid_env_name("MY-VAR"));
    CHECK_FALSE(is_valid_env_name("A B"));
}

TEST_CASE("slug lowercases and collapses separators") {
    CHECK(to_slug("build") == "build");
    CHECK(to_slug("Pre-Deploy") == "pre_deploy");
    CHECK(to_slug("  a--b  c ") == "a_b_c");
    CHECK(to_slug("---") == "hook");
    CHECK(to_slug("Hello World", '-') == "hello-world");
}

TEST_CASE("slug is truncated without a trailing separator") {
    std::string longname(50, 'a');
    CHECK(to_slug(longname).size() == 40);

    // Cut falls right after a separator
    std::string edge = std::string(39, 'a') + "-bbb";
    CHECK(to_slug(edge) == std::string(39, 'a'));
}

TEST_CASE("exec mode parsing") {
    CHECK(parse_exec_mode("exec") == ExecMode::Exec);
    CHECK(parse_exec_mode("script") == ExecMode::Exec);
    CHECK(parse_exec_mode("SOURCE") == ExecMode::Source);
    CHECK_FALSE(parse_exec_mode("fork").has_value());
    CHECK_FALSE(parse_exec_mode("").has_value());

    CHECK(std::string(exec_mode_to_string(ExecMode::Source)) == "source");
}

TEST_CASE("error carries code and context") {
    Error e(ErrorCode::INVALID_HOOK_NAME, "invalid hook name 'a b'");
    e.withContext("declare");
    CHECK(e.code() == ErrorCode::INVALID_HOOK_NAME);
    CHECK(e.message() == "declare: invalid hook name 'a b'");
    CHECK(e.toString() == "INVALID_HOOK_NAME: declare: invalid hook name 'a b'");
}

TEST_CASE("result holds either a value or an error") {
    auto ok = Result<int>::ok(3);
    CHECK(ok.isOk());
    CHECK(ok.value() == 3);

    auto bad = Result<int>::err(Error(ErrorCode::NOT_FOUND, "missing"));
    CHECK(bad.isErr());
    CHECK(bad.valueOr(7) == 7);
    CHECK(bad.error().code() == ErrorCode::NOT_FOUND);

    auto done = Result<void>::ok();
    CHECK(done.isOk());
}

TEST_CASE("run states print in upper case") {
    CHECK(std::string(run_state_to_string(RunState::RunningMergedSequence)) ==
          "RUNNING_MERGED_SEQUENCE");
    CHECK(std::string(run_state_to_string(RunState::Terminated)) == "TERMINATED");
}
