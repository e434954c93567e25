#include <doctest/doctest.h>
#include <hookline/environment.hpp>

#include <cstdlib>

using namespace hookline;

TEST_CASE("set replaces the value") {
    CHECK(apply_env_op(EnvOp::Set, std::string("old"), "new") == "new");
    CHECK(apply_env_op(EnvOp::Set, std::nullopt, "new") == "new");
}

TEST_CASE("append and prepend use the separator") {
    CHECK(apply_env_op(EnvOp::Append, std::string("/usr/bin"), "/opt/bin") == "/usr/bin:/opt/bin");
    CHECK(apply_env_op(EnvOp::Prepend, std::string("/usr/bin"), "/opt/bin") == "/opt/bin:/usr/bin");
    CHECK(apply_env_op(EnvOp::Append, std::string("a"), "b", ";") == "a;b");
}

TEST_CASE("append and prepend on an empty value behave like set") {
    CHECK(apply_env_op(EnvOp::Append, std::nullopt, "/opt/bin") == "/opt/bin");
    CHECK(apply_env_op(EnvOp::Prepend, std::string(""), "/opt/bin") == "/opt/bin");
}

TEST_CASE("remove drops every matching segment") {
    CHECK(apply_env_op(EnvOp::Remove, std::string("/a:/b:/a:/c"), "/a") == "/b:/c");
    CHECK(apply_env_op(EnvOp::Remove, std::string("/a"), "/a") == "");
    CHECK(apply_env_op(EnvOp::Remove, std::string("/ab:/b"), "/a") == "/ab:/b");
    CHECK(apply_env_op(EnvOp::Remove, std::nullopt, "/a") == "");
}

TEST_CASE("environment apply honours the configured separator") {
    Environment env;
    env.set("PATH", "/usr/bin");
    env.apply("PATH", EnvOp::Append, "/opt/tool/bin");
    CHECK(env.get("PATH") == "/usr/bin:/opt/tool/bin");

    env.set_separator(";");
    env.apply("PATH", EnvOp::Prepend, "C:/tools");
    CHECK(env.get("PATH") == "C:/tools;/usr/bin:/opt/tool/bin");
}

TEST_CASE("envp entries are sorted NAME=VALUE strings") {
    Environment env({{"B", "2"}, {"A", "1"}, {"C", ""}});
    auto envp = env.to_envp();
    REQUIRE(envp.size() == 3);
    CHECK(envp[0] == "A=1");
    CHECK(envp[1] == "B=2");
    CHECK(envp[2] == "C=");
}

TEST_CASE("adopt reports changed, added and removed variables") {
    Environment env({{"KEEP", "same"}, {"CHANGE", "old"}, {"DROP", "x"}});
    std::vector<std::string> notified;
    env.set_listener([&](const std::string& name) { notified.push_back(name); });

    size_t changed = env.adopt({{"KEEP", "same"}, {"CHANGE", "new"}, {"ADD", "y"}});

    CHECK(changed == 3);
    CHECK(notified.size() == 3);
    CHECK(env.get("CHANGE") == "new");
    CHECK(env.get("ADD") == "y");
    CHECK_FALSE(env.contains("DROP"));
    CHECK(env.get("KEEP") == "same");
}

TEST_CASE("unset of an absent variable does not notify") {
    Environment env;
    int calls = 0;
    env.set_listener([&](const std::string&) { ++calls; });
    env.unset("NOPE");
    CHECK(calls == 0);
    env.set("YES", "1");
    env.unset("YES");
    CHECK(calls == 2);
}

TEST_CASE("process snapshot sees exported variables") {
    ::setenv("HOOKLINE_ENV_TEST", "value", 1);
    auto env = Environment::from_process();
    CHECK(env.get("HOOKLINE_ENV_TEST") == "value");
    ::unsetenv("HOOKLINE_ENV_TEST");
}
