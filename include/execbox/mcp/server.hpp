#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include "execbox/mcp/protocol.hpp"

namespace execbox::mcp {

using boost::asio::awaitable;

/// Receives one serialized response, without the trailing newline.
using LineWriter = std::function<void(std::string_view)>;

/// Writes `line` plus a newline to stdout and flushes.
void write_stdout_line(std::string_view line);

/// Newline-delimited JSON-RPC over stdin/stdout.
///
/// Each incoming line is dispatched as its own coroutine, so a slow tool
/// call does not hold up later requests. Responses are written from the
/// server's executor only, one complete line at a time.
class StdioServer {
public:
    explicit StdioServer(Protocol& protocol, LineWriter writer = write_stdout_line);

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    /// Handles one line of input. Returns the serialized response, or
    /// nothing for notifications and blank lines.
    auto handle_line(std::string_view line) -> awaitable<std::optional<std::string>>;

    /// Reads stdin until EOF, then waits for in-flight requests to finish.
    auto run() -> awaitable<void>;

    [[nodiscard]] auto in_flight() const noexcept -> std::size_t { return in_flight_; }

private:
    void start_request(boost::asio::any_io_executor executor, std::string line);
    auto process(std::string line) -> awaitable<void>;
    auto drain() -> awaitable<void>;

    Protocol& protocol_;
    LineWriter writer_;
    std::size_t in_flight_ = 0;
};

} // namespace execbox::mcp
