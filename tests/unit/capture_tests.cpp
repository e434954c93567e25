#include <doctest/doctest.h>
#include <hookline/capture.hpp>
#include <hookline/process.hpp>

#include <cstdio>
#include <iostream>
#include <stdexcept>

using namespace hookline;

namespace {

std::vector<std::string> sh(const std::string& script) {
    return {"/bin/sh", "-c", script};
}

} // namespace

TEST_CASE("buffer names are slug plus sequence") {
    CHECK(capture_buffer_name("build", 1) == "__build_1");
    CHECK(capture_buffer_name("build_10_compile", 1) == "__build_10_compile_1");
    CHECK(capture_buffer_name("pre-deploy", 12) == "__pre_deploy_12");
}

TEST_CASE("sequence increases per capture and resets") {
    CaptureHarness harness;
    auto first = harness.run_function("build", [] { return 0; });
    auto second = harness.run_function("build", [] { return 0; });
    REQUIRE(first.isOk());
    REQUIRE(second.isOk());
    CHECK(first.value().buffer.name == "__build_1");
    CHECK(second.value().buffer.name == "__build_2");
    CHECK(harness.sequence() == 2);

    harness.reset_sequence();
    auto third = harness.run_function("test", [] { return 0; });
    REQUIRE(third.isOk());
    CHECK(third.value().buffer.name == "__test_1");
}

TEST_CASE("function output is captured per stream") {
    CaptureHarness harness;
    auto captured = harness.run_function("build", [] {
        std::cout << "compiling" << std::endl;
        std::cerr << "warning: unused" << std::endl;
        std::printf("linking\n");
        std::fflush(stdout);
        return 2;
    });

    REQUIRE(captured.isOk());
    const auto& capture = captured.value();
    CHECK(capture.exit_code == 2);
    CHECK(capture.buffer.stdout_lines() == std::vector<std::string>{"compiling", "linking"});
    CHECK(capture.buffer.stderr_lines() == std::vector<std::string>{"warning: unused"});
}

TEST_CASE("a final line without newline is kept") {
    CaptureHarness harness;
    auto captured = harness.run_function("build", [] {
        std::cout << "no newline";
        return 0;
    });
    REQUIRE(captured.isOk());
    CHECK(captured.value().buffer.stdout_lines() == std::vector<std::string>{"no newline"});
}

TEST_CASE("an escaping exception becomes status 1") {
    CaptureHarness harness;
    auto captured = harness.run_function("build", []() -> int {
        std::cout << "before" << std::endl;
        throw std::runtime_error("exploded");
    });

    REQUIRE(captured.isOk());
    const auto& capture = captured.value();
    CHECK(capture.exit_code == 1);
    CHECK(capture.buffer.stdout_lines() == std::vector<std::string>{"before"});
    REQUIRE(capture.buffer.stderr_lines().size() == 1);
    CHECK(capture.buffer.stderr_lines()[0] == "hook function failed: exploded");
}

TEST_CASE("non-standard throws fail the function and release the streams") {
    CaptureHarness harness;
    auto captured = harness.run_function("build", []() -> int {
        std::cout << "partial" << std::endl;
        throw 42;
    });

    REQUIRE(captured.isOk());
    CHECK(captured.value().exit_code == 1);
    CHECK(captured.value().buffer.stdout_lines() == std::vector<std::string>{"partial"});
    CHECK(captured.value().buffer.stderr_lines() ==
          std::vector<std::string>{"hook function failed: unknown exception"});

    // stdout points back at the original descriptor
    auto again = harness.run_function("build", [] {
        std::cout << "next" << std::endl;
        return 0;
    });
    REQUIRE(again.isOk());
    CHECK(again.value().buffer.stdout_lines() == std::vector<std::string>{"next"});
}

TEST_CASE("standard streams are restored after a capture") {
    CaptureHarness harness;
    auto captured = harness.run_function("build", [] {
        std::cout << "inside" << std::endl;
        return 0;
    });
    REQUIRE(captured.isOk());

    // A second capture would miss its output if fd 1 still pointed at the old pipe
    auto again = harness.run_function("build", [] {
        std::cout << "again" << std::endl;
        return 0;
    });
    REQUIRE(again.isOk());
    CHECK(again.value().buffer.stdout_lines() == std::vector<std::string>{"again"});
}

TEST_CASE("subprocess output and exit code") {
    CaptureHarness harness;
    Environment env = Environment::from_process();
    auto captured = harness.run_process("build_10_compile",
                                        sh("echo compiling; echo error >&2; exit 2"), env);

    REQUIRE(captured.isOk());
    const auto& capture = captured.value();
    CHECK(capture.buffer.name == "__build_10_compile_1");
    CHECK(capture.exit_code == 2);
    CHECK(capture.buffer.stdout_lines() == std::vector<std::string>{"compiling"});
    CHECK(capture.buffer.stderr_lines() == std::vector<std::string>{"error"});
}

TEST_CASE("subprocess sees the given environment only") {
    CaptureHarness harness;
    Environment env({{"PATH", "/usr/bin:/bin"}, {"GREETING", "hello"}});
    auto captured = harness.run_process("env", sh("echo \"$GREETING\"; echo \"${HOME:-unset}\""), env);

    REQUIRE(captured.isOk());
    CHECK(captured.value().buffer.stdout_lines() == std::vector<std::string>{"hello", "unset"});
}

TEST_CASE("a signalled subprocess reports 128 plus the signal") {
    CaptureHarness harness;
    Environment env = Environment::from_process();
    auto captured = harness.run_process("kill", sh("kill -TERM $$"), env);

    REQUIRE(captured.isOk());
    CHECK(captured.value().exit_code == 128 + 15);
}

TEST_CASE("a missing program exits with 127") {
    CaptureHarness harness;
    Environment env = Environment::from_process();
    auto captured = harness.run_process("missing", {"/nonexistent/hookline-binary"}, env);

    REQUIRE(captured.isOk());
    CHECK(captured.value().exit_code == 127);
}

TEST_CASE("decode_status maps exits and signals") {
    CHECK(process::decode_status(0) == 0);
    CHECK(process::decode_status(3 << 8) == 3);
    CHECK(process::decode_status(9) == 128 + 9);
}

TEST_CASE("resolve_executable searches PATH") {
    Environment env;
    env.set("PATH", "/nonexistent:/bin:/usr/bin");
    std::string sh_path = process::resolve_executable("sh", env);
    CHECK((sh_path == "/bin/sh" || sh_path == "/usr/bin/sh"));

    CHECK(process::resolve_executable("./local", env) == "./local");
    CHECK(process::resolve_executable("no-such-tool-xyz", env) == "no-such-tool-xyz");
}

TEST_CASE("attached runs return the report descriptor contents") {
    Environment env = Environment::from_process();
    auto ran = process::run_attached(sh("printf 'A=1' >&3; exit 4"), env, nullptr, 3);

    REQUIRE(ran.isOk());
    CHECK(ran.value().exit_code == 4);
    CHECK(ran.value().report == "A=1");
}
