// Process runner against real /bin/sh commands
#include <catch2/catch_test_macros.hpp>
#include "core/errors.hpp"
#include "media/process_runner.hpp"
#include "utils/logging.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace wms;
using namespace std::chrono_literals;

TEST_CASE("ProcessRunner quotes arguments for the shell") {
    REQUIRE(ProcessRunner::quote("plain") == "'plain'");
    REQUIRE(ProcessRunner::quote("it's") == "'it'\\''s'");
    REQUIRE(ProcessRunner::command_line({"echo", "a b", "$HOME"}) == "'echo' 'a b' '$HOME'");
}

TEST_CASE("ProcessRunner captures output and exit code") {
    ProcessRunner runner(0s, make_null_logger());

    auto ok = runner.run({"echo", "hello world"});
    REQUIRE(ok.succeeded());
    REQUIRE(ok.output == "hello world\n");

    auto failed = runner.run({"sh", "-c", "exit 3"});
    REQUIRE(failed.exit_code == 3);
    REQUIRE_FALSE(failed.succeeded());
}

TEST_CASE("ProcessRunner passes special characters through unchanged") {
    ProcessRunner runner(0s, make_null_logger());
    auto result = runner.run({"printf", "%s", "it's a \"test\" $HOME;"});
    REQUIRE(result.output == "it's a \"test\" $HOME;");
}

TEST_CASE("ProcessRunner merges stderr into the output") {
    ProcessRunner runner(0s, make_null_logger());
    auto result = runner.run({"sh", "-c", "echo to-stderr 1>&2"});
    REQUIRE(result.output.find("to-stderr") != std::string::npos);
}

TEST_CASE("ProcessRunner reports a timeout as AppError") {
    ProcessRunner runner(1s, make_null_logger());
    REQUIRE(runner.run({"true"}).succeeded());
    REQUIRE_THROWS_AS(runner.run({"sleep", "5"}), AppError);
}

TEST_CASE("ProcessRunner reports failures after cancellation as interrupted") {
    std::atomic<bool> cancel{false};
    ProcessRunner runner(0s, make_null_logger(), &cancel);

    REQUIRE(runner.run({"false"}).exit_code == 1);

    cancel = true;
    REQUIRE_THROWS_AS(runner.run({"false"}), InterruptedError);
    REQUIRE_THROWS_AS(runner.run({"sh", "-c", "exit 130"}), InterruptedError);

    // A command that still finishes cleanly keeps its result
    auto ok = runner.run({"echo", "done"});
    REQUIRE(ok.succeeded());
    REQUIRE(ok.output == "done\n");
}

TEST_CASE("ProcessRunner needs a program") {
    ProcessRunner runner(0s, make_null_logger());
    REQUIRE_THROWS_AS(runner.run({}), std::invalid_argument);
}
