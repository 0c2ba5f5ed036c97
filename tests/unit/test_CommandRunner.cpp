#include <catch2/catch_test_macros.hpp>

#include "infrastructure/system/CommandRunner.hpp"

#include <chrono>

using namespace openfing::infra;

TEST_CASE("CommandRunner::run", "[CommandRunner]") {
    CommandRunner runner(std::chrono::seconds(5));

    SECTION("Captures standard output") {
        auto result = runner.run("echo hello");
        REQUIRE(result.succeeded());
        REQUIRE(result.output == "hello\n");
    }

    SECTION("Reports the exit status") {
        auto result = runner.run("echo partial; exit 3");
        REQUIRE(result.exitCode == 3);
        REQUIRE(result.output == "partial\n");
    }

    SECTION("Supports pipelines and quoting") {
        auto result = runner.run("printf 'a b\\nc d\\n' | awk '{print $2}'");
        REQUIRE(result.output == "b\nd\n");
    }
}

TEST_CASE("CommandRunner time limit", "[CommandRunner]") {
    CommandRunner runner(std::chrono::seconds(1));

    auto start = std::chrono::steady_clock::now();
    auto result = runner.run("sleep 5");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(result.succeeded());
    REQUIRE(elapsed < std::chrono::seconds(4));
}

TEST_CASE("CommandRunner::captureOutput", "[CommandRunner]") {
    CommandRunner runner;

    REQUIRE(runner.captureOutput("echo ok") == "ok\n");
    REQUIRE(runner.captureOutput("echo ignored; false").empty());
    REQUIRE(runner.captureOutput("openfing-no-such-command-xyz 2>/dev/null").empty());
}

TEST_CASE("CommandRunner::commandExists", "[CommandRunner]") {
    CommandRunner runner;

    REQUIRE(runner.commandExists("sh"));
    REQUIRE_FALSE(runner.commandExists("openfing-no-such-command-xyz"));
}

TEST_CASE("CommandRunner::shellQuote", "[CommandRunner]") {
    REQUIRE(CommandRunner::shellQuote("eth0") == "'eth0'");
    REQUIRE(CommandRunner::shellQuote("a b") == "'a b'");
    REQUIRE(CommandRunner::shellQuote("it's") == "'it'\\''s'");

    SECTION("Quoted arguments reach the command unchanged") {
        CommandRunner runner;
        auto output = runner.captureOutput("printf '%s' " + CommandRunner::shellQuote("x; echo pwned"));
        REQUIRE(output == "x; echo pwned");
    }
}
