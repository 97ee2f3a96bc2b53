#include <catch2/catch_test_macros.hpp>

#ifndef _WIN32

#include <filesystem>

#include "execbox/tools/tool_surface.hpp"

using namespace execbox;
using namespace execbox::tools;

namespace {

auto sandbox_root() -> std::filesystem::path {
    return std::filesystem::canonical(std::filesystem::temp_directory_path()) / "execbox_surface";
}

/// Policy over a POSIX shell: echo, sleep and touch are allowed, and only
/// the sandbox directory may be used.
auto make_policy(int timeout_seconds = 10) -> std::shared_ptr<const security::SecurityPolicy> {
    PolicyConfig config;
    config.allowed_commands = {"echo", "sleep", "touch"};
    config.allowed_directories = {sandbox_root().string() + "*"};
    config.blocked_patterns = {
        {R"([;&|`])", std::nullopt},
        {"Remove-Item", std::nullopt},
    };
    config.max_command_length = 200;
    config.timeout_seconds = timeout_seconds;

    auto policy = security::SecurityPolicy::create(config);
    REQUIRE(policy.has_value());
    return std::make_shared<const security::SecurityPolicy>(std::move(*policy));
}

struct Fixture {
    std::filesystem::path root = sandbox_root();
    security::PolicyStore store;
    exec::Executor executor{ShellConfig{.program = "/bin/sh", .arguments = {"-c"}}};
    ToolSurface surface{store, executor};

    explicit Fixture(int timeout_seconds = 10) : store(make_policy(timeout_seconds)) {
        std::filesystem::create_directories(root);
    }
    ~Fixture() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }
};

} // anonymous namespace

TEST_CASE("execute_powershell runs an allowed command", "[tools][surface]") {
    Fixture f;
    auto r = f.surface.execute_powershell("echo hello", f.root.string());

    CHECK(r.success);
    CHECK(r.return_code == 0);
    CHECK(r.stdout_text == "hello");
    CHECK(r.working_directory == f.root.string());
}

TEST_CASE("denied commands never start a process", "[tools][surface]") {
    Fixture f;
    auto marker = f.root / "marker";

    SECTION("blocked pattern") {
        auto cmd = "echo hi; touch " + marker.string();
        auto r = f.surface.execute_powershell(cmd);
        CHECK_FALSE(r.success);
        CHECK_FALSE(r.return_code.has_value());
        CHECK(r.stderr_text == "Command contains blocked pattern (command separator): [;&|`]");
        CHECK(r.stdout_text.empty());
    }

    SECTION("command not allowed") {
        auto r = f.surface.execute_powershell("mkdir " + marker.string());
        CHECK_FALSE(r.success);
        CHECK(r.stderr_text == "Command 'mkdir' is not in the allowed commands list");
    }

    SECTION("directory not allowed") {
        auto r = f.surface.execute_powershell("touch " + marker.string(), "/");
        CHECK_FALSE(r.success);
        CHECK(r.stderr_text == "Directory not allowed: /");
        CHECK(r.working_directory == "/");
    }

    CHECK_FALSE(std::filesystem::exists(marker));
}

TEST_CASE("a missing working directory is reported before spawning", "[tools][surface]") {
    Fixture f;
    auto missing = (f.root / "missing").string();
    auto r = f.surface.execute_powershell("echo hi", missing);

    CHECK_FALSE(r.success);
    CHECK_FALSE(r.return_code.has_value());
    CHECK(r.stderr_text == "Directory does not exist: " + missing);
}

TEST_CASE("a working directory is checked in normalized form", "[tools][surface]") {
    Fixture f;
    auto through_missing = (f.root / "missing" / "..").string();
    auto r = f.surface.execute_powershell("echo hi", through_missing);

    CHECK(r.success);
    CHECK(r.stdout_text == "hi");
    CHECK(r.working_directory == f.root.string());
}

TEST_CASE("execute_powershell applies the policy timeout", "[tools][surface]") {
    Fixture f(1);
    auto r = f.surface.execute_powershell("sleep 5");

    CHECK_FALSE(r.success);
    CHECK(r.timed_out);
    CHECK_FALSE(r.return_code.has_value());
    CHECK(r.stderr_text == "Command timed out after 1 seconds");
}

TEST_CASE("validate_command passes the verdict through", "[tools][surface]") {
    Fixture f;
    CHECK(f.surface.validate_command("echo hi").is_allowed);

    auto denied = f.surface.validate_command(std::string(201, 'e'));
    CHECK_FALSE(denied.is_allowed);
    CHECK(denied.reason == "Command exceeds maximum length of 200 characters");
}

TEST_CASE("listing operations return the policy lists", "[tools][surface]") {
    Fixture f;
    CHECK(f.surface.list_allowed_commands() == std::vector<std::string>{"echo", "sleep", "touch"});
    REQUIRE(f.surface.list_allowed_directories().size() == 1);
    CHECK(f.surface.list_allowed_directories()[0] == f.root.string() + "*");
}

TEST_CASE("get_security_config counts match the policy", "[tools][surface]") {
    Fixture f(7);
    auto summary = f.surface.get_security_config();

    CHECK(summary.allowed_commands_count == 3);
    CHECK(summary.allowed_directories_count == 1);
    CHECK(summary.blocked_patterns_count == 2);
    CHECK(summary.max_command_length == 200);
    CHECK(summary.timeout_seconds == 7);

    nlohmann::json j = summary;
    CHECK(j.size() == 5);
    CHECK(j["blocked_patterns_count"] == 2);
}

TEST_CASE("a reloaded policy applies to the next call", "[tools][surface]") {
    Fixture f;
    CHECK(f.surface.get_security_config().timeout_seconds == 10);

    f.store.replace(make_policy(3));
    CHECK(f.surface.get_security_config().timeout_seconds == 3);
}

#endif
