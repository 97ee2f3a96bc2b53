#include <catch2/catch_test_macros.hpp>

#ifndef _WIN32

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "execbox/exec/process.hpp"

using namespace execbox;
using namespace execbox::exec;
using namespace std::chrono_literals;

namespace {

auto sh(std::string script) -> ProcessSpec {
    return ProcessSpec{.argv = {"/bin/sh", "-c", std::move(script)}, .working_directory = std::nullopt};
}

/// A pid counts as gone once it no longer exists or is a zombie.
auto process_alive(long pid) -> bool {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat) return false;
    std::string content;
    std::getline(stat, content);
    auto close = content.rfind(')');
    if (close == std::string::npos || close + 2 >= content.size()) return false;
    return content[close + 2] != 'Z';
}

auto gone_within(long pid, std::chrono::milliseconds limit) -> bool {
    auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until) {
        if (!process_alive(pid)) return true;
        std::this_thread::sleep_for(20ms);
    }
    return !process_alive(pid);
}

} // anonymous namespace

TEST_CASE("run_process captures both streams and the exit code", "[exec][process]") {
    auto outcome = run_process(sh("echo out; echo err 1>&2; exit 3"), 10s);
    REQUIRE(outcome.has_value());
    CHECK_FALSE(outcome->timed_out);
    CHECK(outcome->exit_code == 3);
    CHECK(outcome->stdout_text == "out\n");
    CHECK(outcome->stderr_text == "err\n");
}

TEST_CASE("run_process drains large output", "[exec][process]") {
    auto outcome = run_process(sh("head -c 200000 /dev/zero | tr '\\0' a"), 10s);
    REQUIRE(outcome.has_value());
    CHECK(outcome->exit_code == 0);
    CHECK(outcome->stdout_text.size() == 200000);
}

TEST_CASE("a child killed by a signal reports 128 + signal", "[exec][process]") {
    auto outcome = run_process(sh("kill -9 $$"), 10s);
    REQUIRE(outcome.has_value());
    CHECK(outcome->exit_code == 137);
}

TEST_CASE("spawn failures are errors", "[exec][process]") {
    SECTION("missing program") {
        auto outcome = run_process(ProcessSpec{.argv = {"/nonexistent/execbox-shell"}}, 5s);
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code() == ErrorCode::SpawnFailed);
        CHECK(outcome.error().what().find("Failed to start") != std::string::npos);
    }

    SECTION("missing working directory") {
        auto spec = sh("pwd");
        spec.working_directory = "/nonexistent/execbox-dir";
        auto outcome = run_process(spec, 5s);
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code() == ErrorCode::SpawnFailed);
        CHECK(outcome.error().what().find("Cannot enter working directory") != std::string::npos);
    }

    SECTION("empty argv") {
        auto outcome = run_process(ProcessSpec{}, 5s);
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code() == ErrorCode::SpawnFailed);
    }
}

TEST_CASE("the child starts in the requested directory", "[exec][process]") {
    auto dir = std::filesystem::temp_directory_path() / "execbox_test_cwd";
    std::filesystem::create_directories(dir);

    auto spec = sh("pwd -P");
    spec.working_directory = dir;
    auto outcome = run_process(spec, 10s);
    REQUIRE(outcome.has_value());
    CHECK(outcome->stdout_text == std::filesystem::canonical(dir).string() + "\n");

    std::filesystem::remove_all(dir);
}

TEST_CASE("a timeout kills the child and keeps partial output", "[exec][process]") {
    auto started = std::chrono::steady_clock::now();
    auto outcome = run_process(sh("echo started; sleep 5"), 1s);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(outcome.has_value());
    CHECK(outcome->timed_out);
    CHECK_FALSE(outcome->exit_code.has_value());
    CHECK(outcome->stdout_text == "started\n");
    CHECK(elapsed < 4s);
}

TEST_CASE("a timeout kills grandchildren too", "[exec][process]") {
    auto outcome = run_process(sh("sleep 30 & echo $!; wait"), 1s);
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->timed_out);

    auto grandchild = std::stol(outcome->stdout_text);
    CHECK(gone_within(grandchild, 2000ms));
}

TEST_CASE("descendants left behind after exit are killed", "[exec][process]") {
    auto started = std::chrono::steady_clock::now();
    auto outcome = run_process(sh("sleep 30 & echo $!"), 10s);
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(outcome.has_value());
    CHECK_FALSE(outcome->timed_out);
    CHECK(outcome->exit_code == 0);
    CHECK(elapsed < 5s);

    auto grandchild = std::stol(outcome->stdout_text);
    CHECK(gone_within(grandchild, 2000ms));
}

TEST_CASE("dropping a running ChildProcess kills it", "[exec][process]") {
    long pid = 0;
    {
        auto child = ChildProcess::spawn(sh("sleep 30"));
        REQUIRE(child.has_value());
        pid = static_cast<long>((*child)->pid());
        CHECK_FALSE((*child)->has_exited());
    }
    CHECK(gone_within(pid, 2000ms));
}

TEST_CASE("bare program names are looked up on PATH", "[exec][process]") {
    SECTION("found") {
        auto outcome = run_process(ProcessSpec{.argv = {"sh", "-c", "echo found"},
                                               .working_directory = std::nullopt}, 10s);
        REQUIRE(outcome.has_value());
        CHECK(outcome->exit_code == 0);
        CHECK(outcome->stdout_text == "found\n");
    }

    SECTION("missing") {
        auto outcome = run_process(ProcessSpec{.argv = {"execbox-no-such-program"},
                                               .working_directory = std::nullopt}, 10s);
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code() == ErrorCode::SpawnFailed);
        CHECK(outcome.error().message() == "Failed to start 'execbox-no-such-program'");
    }
}

TEST_CASE("concurrent spawns do not hold each other's pipes", "[exec][process]") {
    // Long commands are killed at 2s. A quick command that inherited one of
    // their pipe ends would be held until that kill.
    constexpr int kThreads = 8;
    constexpr int kRounds = 5;
    std::vector<std::chrono::milliseconds> quick(kThreads * kRounds, 0ms);
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t, &quick] {
            for (int r = 0; r < kRounds; ++r) {
                if (t % 2 == 0) {
                    [[maybe_unused]] auto slow = run_process(sh("sleep 10"), 2s);
                } else {
                    auto started = std::chrono::steady_clock::now();
                    [[maybe_unused]] auto fast = run_process(sh("true"), 10s);
                    quick[t * kRounds + r] = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - started);
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    for (int t = 1; t < kThreads; t += 2) {
        for (int r = 0; r < kRounds; ++r) {
            CHECK(quick[t * kRounds + r] < 1500ms);
        }
    }
}

#endif
