#include <catch2/catch_test_macros.hpp>

#include <boost/asio.hpp>

#include "execbox/mcp/handlers.hpp"
#include "execbox/mcp/server.hpp"

using namespace execbox;
using namespace execbox::mcp;

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

struct Fixture {
    tools::ToolRegistry registry;
    Protocol protocol;
    std::vector<std::string> written;
    StdioServer server{protocol, [this](std::string_view line) {
        written.emplace_back(line);
    }};

    Fixture() {
        register_mcp_handlers(protocol, registry, ServerInfo{.version = "test"});
    }

    auto call(std::string_view line) -> std::optional<json> {
        auto out = run_sync(server.handle_line(line));
        if (!out) return std::nullopt;
        return json::parse(*out);
    }
};

} // anonymous namespace

TEST_CASE("StdioServer answers requests", "[mcp][server]") {
    Fixture f;
    auto resp = f.call(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    REQUIRE(resp.has_value());
    CHECK((*resp)["id"] == 1);
    CHECK((*resp)["result"] == json::object());
}

TEST_CASE("StdioServer keeps string ids", "[mcp][server]") {
    Fixture f;
    auto resp = f.call(R"({"jsonrpc":"2.0","id":"x-9","method":"tools/list"})");
    REQUIRE(resp.has_value());
    CHECK((*resp)["id"] == "x-9");
    CHECK((*resp)["result"]["tools"].is_array());
}

TEST_CASE("StdioServer reports parse errors with a null id", "[mcp][server]") {
    Fixture f;
    auto resp = f.call("{oops");
    REQUIRE(resp.has_value());
    CHECK((*resp)["id"].is_null());
    CHECK((*resp)["error"]["code"] == -32700);
}

TEST_CASE("StdioServer reports invalid requests", "[mcp][server]") {
    Fixture f;
    auto resp = f.call(R"({"id":3,"method":"ping"})");
    REQUIRE(resp.has_value());
    CHECK((*resp)["error"]["code"] == -32600);
}

TEST_CASE("StdioServer reports unknown methods", "[mcp][server]") {
    Fixture f;
    auto resp = f.call(R"({"jsonrpc":"2.0","id":4,"method":"resources/list"})");
    REQUIRE(resp.has_value());
    CHECK((*resp)["id"] == 4);
    CHECK((*resp)["error"]["code"] == -32601);
}

TEST_CASE("StdioServer stays silent for notifications and blank lines", "[mcp][server]") {
    Fixture f;
    CHECK_FALSE(f.call(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    CHECK_FALSE(f.call(R"({"jsonrpc":"2.0","method":"notifications/unknown"})").has_value());
    CHECK_FALSE(f.call("   ").has_value());
    CHECK_FALSE(f.call("").has_value());
}

TEST_CASE("StdioServer trims surrounding whitespace", "[mcp][server]") {
    Fixture f;
    auto resp = f.call("  {\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"ping\"}\r");
    REQUIRE(resp.has_value());
    CHECK((*resp)["id"] == 5);
}

TEST_CASE("handle_line does not write by itself", "[mcp][server]") {
    Fixture f;
    f.call(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    CHECK(f.written.empty());
    CHECK(f.server.in_flight() == 0);
}
