#include <doctest/doctest.h>
#include <hookline/contract.hpp>

using namespace hookline;

TEST_CASE("env directives by operator") {
    SUBCASE("set") {
        auto d = parse_directive("contract:env:MODE=release");
        REQUIRE(d.isOk());
        CHECK(d.value().kind == DirectiveKind::SetEnv);
        CHECK(d.value().name == "MODE");
        CHECK(d.value().value == "release");
    }
    SUBCASE("append") {
        auto d = parse_directive("contract:env:PATH+=/opt/tool/bin");
        REQUIRE(d.isOk());
        CHECK(d.value().kind == DirectiveKind::AppendEnv);
        CHECK(d.value().name == "PATH");
        CHECK(d.value().value == "/opt/tool/bin");
    }
    SUBCASE("prepend") {
        auto d = parse_directive("contract:env:PATH^=/opt/first");
        REQUIRE(d.isOk());
        CHECK(d.value().kind == DirectiveKind::PrependEnv);
        CHECK(d.value().value == "/opt/first");
    }
    SUBCASE("remove") {
        auto d = parse_directive("contract:env:PATH-=/usr/games");
        REQUIRE(d.isOk());
        CHECK(d.value().kind == DirectiveKind::RemoveEnv);
        CHECK(d.value().value == "/usr/games");
    }
}

TEST_CASE("operators are detected in fixed order") {
    auto d = parse_directive("contract:env:OPTS=a=b");
    REQUIRE(d.isOk());
    CHECK(d.value().kind == DirectiveKind::SetEnv);
    CHECK(d.value().name == "OPTS");
    CHECK(d.value().value == "a=b");

    auto set = parse_directive("contract:env:OPTS=a+=b");
    REQUIRE(set.isOk());
    CHECK(set.value().kind == DirectiveKind::SetEnv);
    CHECK(set.value().name == "OPTS");
    CHECK(set.value().value == "a+=b");

    auto remove = parse_directive("contract:env:FLAGS-=-O2^=x");
    REQUIRE(remove.isOk());
    CHECK(remove.value().kind == DirectiveKind::RemoveEnv);
    CHECK(remove.value().name == "FLAGS");
    CHECK(remove.value().value == "-O2^=x");

    auto empty = parse_directive("contract:env:EMPTY=");
    REQUIRE(empty.isOk());
    CHECK(empty.value().value.empty());
}

TEST_CASE("invalid env directives") {
    CHECK(parse_directive("contract:env:NOOPERATOR").isErr());
    CHECK(parse_directive("contract:env:1BAD=x").isErr());
    CHECK(parse_directive("contract:env:MY-VAR=x").isErr());
    CHECK(parse_directive("contract:env:=x").isErr());

    auto bad = parse_directive("contract:env:NOOPERATOR");
    CHECK(bad.error().code() == ErrorCode::INVALID_DIRECTIVE);
}

TEST_CASE("route and exit directives") {
    auto route = parse_directive("contract:route:/tmp/next.sh");
    REQUIRE(route.isOk());
    CHECK(route.value().kind == DirectiveKind::Route);
    CHECK(route.value().value == "/tmp/next.sh");

    auto code = parse_directive("contract:exit:42");
    REQUIRE(code.isOk());
    CHECK(code.value().kind == DirectiveKind::Exit);
    CHECK(code.value().code == 42);

    CHECK(parse_directive("contract:exit:0").isOk());
    CHECK(parse_directive("contract:exit:255").isOk());
}

TEST_CASE("invalid route and exit directives") {
    CHECK(parse_directive("contract:route:").isErr());
    CHECK(parse_directive("contract:exit:").isErr());
    CHECK(parse_directive("contract:exit:256").isErr());
    CHECK(parse_directive("contract:exit:-1").isErr());
    CHECK(parse_directive("contract:exit:abc").isErr());
    CHECK(parse_directive("contract:exit:99999999999999999999").isErr());
    CHECK(parse_directive("contract:unknown:x").isErr());
    CHECK(parse_directive("env:PATH=x").isErr());
}

TEST_CASE("only prefixed lines are contract lines") {
    CHECK(is_contract_line("contract:exit:0"));
    CHECK_FALSE(is_contract_line(" contract:exit:0"));
    CHECK_FALSE(is_contract_line("building contract:env:A=1"));
}

TEST_CASE("format produces the wire form") {
    CHECK(format_directive(env_directive("PATH", EnvOp::Append, "/opt/bin")) ==
          "contract:env:PATH+=/opt/bin");
    CHECK(format_directive(env_directive("PATH", EnvOp::Remove, "/x")) == "contract:env:PATH-=/x");
    CHECK(format_directive(route_directive("/tmp/r.sh")) == "contract:route:/tmp/r.sh");
    CHECK(format_directive(exit_directive(3)) == "contract:exit:3");
}

TEST_CASE("applying env directives mutates the environment") {
    Environment env;
    env.set("PATH", "/usr/bin:/usr/games");
    FlowState flow;

    apply_directive(parse_directive("contract:env:PATH+=/opt/bin").value(), env, flow);
    apply_directive(parse_directive("contract:env:PATH-=/usr/games").value(), env, flow);
    apply_directive(parse_directive("contract:env:MODE=ci").value(), env, flow);

    CHECK(env.get("PATH") == "/usr/bin:/opt/bin");
    CHECK(env.get("MODE") == "ci");
    CHECK_FALSE(flow.terminate);
}

TEST_CASE("route and exit request termination") {
    Environment env;
    FlowState flow;

    apply_directive(route_directive("/tmp/next.sh"), env, flow);
    CHECK(flow.terminate);
    CHECK(flow.route == "/tmp/next.sh");
    CHECK_FALSE(flow.exit_code.has_value());

    apply_directive(exit_directive(7), env, flow);
    CHECK(flow.exit_code == 7);

    flow.clear();
    CHECK_FALSE(flow.terminate);
    CHECK(flow.route.empty());
    CHECK_FALSE(flow.exit_code.has_value());
}
