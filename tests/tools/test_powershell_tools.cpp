#include <catch2/catch_test_macros.hpp>

#ifndef _WIN32

#include <filesystem>

#include <boost/asio.hpp>

#include "execbox/mcp/handlers.hpp"
#include "execbox/tools/powershell_tools.hpp"

using namespace execbox;
using namespace execbox::tools;
using json = nlohmann::json;

namespace {

template <typename T>
T run_sync(boost::asio::awaitable<T> coro) {
    boost::asio::io_context ioc;
    T result;
    boost::asio::co_spawn(ioc,
        [&]() -> boost::asio::awaitable<void> {
            result = co_await std::move(coro);
        },
        boost::asio::detached);
    ioc.run();
    return result;
}

auto make_policy() -> std::shared_ptr<const security::SecurityPolicy> {
    PolicyConfig config;
    config.allowed_commands = {"echo", "printf", "pwd"};
    config.allowed_directories = {
        std::filesystem::canonical(std::filesystem::temp_directory_path()).string() + "*"};
    config.blocked_patterns = {{R"([;&|`])", std::nullopt}};
    config.max_command_length = 100;
    config.timeout_seconds = 5;

    auto policy = security::SecurityPolicy::create(config);
    REQUIRE(policy.has_value());
    return std::make_shared<const security::SecurityPolicy>(std::move(*policy));
}

struct Fixture {
    security::PolicyStore store{make_policy()};
    exec::Executor executor{ShellConfig{.program = "/bin/sh", .arguments = {"-c"}}};
    ToolSurface surface{store, executor};
    boost::asio::thread_pool pool{2};
    ToolRegistry registry;

    Fixture() { register_builtin_tools(registry, surface, pool); }
    ~Fixture() { pool.join(); }
};

} // anonymous namespace

TEST_CASE("register_builtin_tools installs the five tools in order", "[tools][powershell]") {
    Fixture f;
    auto defs = f.registry.list();
    REQUIRE(defs.size() == 5);
    CHECK(defs[0].name == "execute_powershell");
    CHECK(defs[1].name == "validate_command");
    CHECK(defs[2].name == "list_allowed_commands");
    CHECK(defs[3].name == "list_allowed_directories");
    CHECK(defs[4].name == "get_security_config");
}

TEST_CASE("execute_powershell schema requires only the command", "[tools][powershell]") {
    Fixture f;
    auto schema = f.registry.get("execute_powershell")->definition().input_schema();
    CHECK(schema["required"] == json::array({"command"}));
    CHECK(schema["properties"].contains("working_directory"));
}

TEST_CASE("execute_powershell runs on the worker pool", "[tools][powershell]") {
    Fixture f;

    SECTION("allowed command") {
        auto result = run_sync(f.registry.execute("execute_powershell",
            json{{"command", "echo from-pool"}}));
        REQUIRE(result.has_value());
        CHECK((*result)["success"] == true);
        CHECK((*result)["return_code"] == 0);
        CHECK((*result)["stdout"] == "from-pool");
        CHECK((*result)["working_directory"].is_null());
    }

    SECTION("working directory is used") {
        auto dir = std::filesystem::canonical(std::filesystem::temp_directory_path()).string();
        auto result = run_sync(f.registry.execute("execute_powershell",
            json{{"command", "pwd"}, {"working_directory", dir}}));
        REQUIRE(result.has_value());
        CHECK((*result)["stdout"] == dir);
        CHECK((*result)["working_directory"] == dir);
    }

    SECTION("empty working directory means none") {
        auto result = run_sync(f.registry.execute("execute_powershell",
            json{{"command", "echo hi"}, {"working_directory", ""}}));
        REQUIRE(result.has_value());
        CHECK((*result)["success"] == true);
        CHECK((*result)["working_directory"].is_null());
    }

    SECTION("denied command is a normal result") {
        auto result = run_sync(f.registry.execute("execute_powershell",
            json{{"command", "echo a | echo b"}}));
        REQUIRE(result.has_value());
        CHECK((*result)["success"] == false);
        CHECK((*result)["return_code"].is_null());
        CHECK((*result)["stderr"] == "Command contains blocked pattern (command separator): [;&|`]");
    }
}

TEST_CASE("tool arguments are checked", "[tools][powershell]") {
    Fixture f;

    SECTION("missing command") {
        auto result = run_sync(f.registry.execute("execute_powershell", json::object()));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
        CHECK(result.error().detail() == "command");
    }

    SECTION("command of the wrong type") {
        auto result = run_sync(f.registry.execute("validate_command", json{{"command", 42}}));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("working directory of the wrong type") {
        auto result = run_sync(f.registry.execute("execute_powershell",
            json{{"command", "echo hi"}, {"working_directory", json::array()}}));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().detail() == "working_directory");
    }
}

TEST_CASE("validate_command reports the verdict as JSON", "[tools][powershell]") {
    Fixture f;

    auto allowed = run_sync(f.registry.execute("validate_command", json{{"command", "echo hi"}}));
    REQUIRE(allowed.has_value());
    CHECK((*allowed)["is_allowed"] == true);
    CHECK((*allowed)["reason"] == "Command is allowed");
    CHECK((*allowed)["command"] == "echo hi");

    auto denied = run_sync(f.registry.execute("validate_command", json{{"command", "rm -rf x"}}));
    REQUIRE(denied.has_value());
    CHECK((*denied)["is_allowed"] == false);
    CHECK((*denied)["reason"] == "Command 'rm' is not in the allowed commands list");
}

TEST_CASE("listing tools return arrays and the summary an object", "[tools][powershell]") {
    Fixture f;

    auto commands = run_sync(f.registry.execute("list_allowed_commands", json::object()));
    REQUIRE(commands.has_value());
    CHECK(*commands == json::array({"echo", "printf", "pwd"}));

    auto dirs = run_sync(f.registry.execute("list_allowed_directories", json::object()));
    REQUIRE(dirs.has_value());
    CHECK(dirs->is_array());
    CHECK(dirs->size() == 1);

    auto summary = run_sync(f.registry.execute("get_security_config", json::object()));
    REQUIRE(summary.has_value());
    CHECK((*summary)["allowed_commands_count"] == 3);
    CHECK((*summary)["allowed_directories_count"] == 1);
    CHECK((*summary)["blocked_patterns_count"] == 1);
    CHECK((*summary)["max_command_length"] == 100);
    CHECK((*summary)["timeout_seconds"] == 5);
}

TEST_CASE("tools/call returns output that is not UTF-8", "[tools][powershell]") {
    Fixture f;
    mcp::Protocol protocol;
    mcp::register_mcp_handlers(protocol, f.registry, mcp::ServerInfo{.version = "test"});

    mcp::RequestFrame request{
        .id = json(1),
        .method = "tools/call",
        .params = json{{"name", "execute_powershell"},
                       {"arguments", {{"command", "printf 'caf\\351'"}}}},
    };
    auto result = run_sync(protocol.dispatch(request));

    REQUIRE(result.has_value());
    CHECK((*result)["isError"] == false);
    CHECK((*result)["structuredContent"]["success"] == true);
    CHECK((*result)["structuredContent"]["stdout"] == "caf\xEF\xBF\xBD");

    auto line = mcp::serialize_response(mcp::make_response(1, *result));
    CHECK_FALSE(line.empty());
}

#endif
