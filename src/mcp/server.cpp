#include "execbox/mcp/server.hpp"

#include <chrono>
#include <cstdio>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "execbox/core/logger.hpp"
#include "execbox/core/utils.hpp"

#if defined(BOOST_ASIO_HAS_POSIX_STREAM_DESCRIPTOR)
#include <unistd.h>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#else
#include <atomic>
#include <iostream>
#include <memory>
#include <thread>
#endif

namespace execbox::mcp {

namespace net = boost::asio;
using namespace std::chrono_literals;

void write_stdout_line(std::string_view line) {
    std::fwrite(line.data(), 1, line.size(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

StdioServer::StdioServer(Protocol& protocol, LineWriter writer)
    : protocol_(protocol), writer_(std::move(writer)) {}

auto StdioServer::handle_line(std::string_view line)
    -> awaitable<std::optional<std::string>> {
    auto text = utils::trim(line);
    if (text.empty()) {
        co_return std::nullopt;
    }

    auto request = parse_request(text);
    if (!request) {
        LOG_WARN("Rejected message [{}]: {}", error_code_to_string(request.error().code()),
                 request.error().what());
        co_return serialize_response(make_error_response(nullptr, request.error()));
    }

    if (request->is_notification()) {
        if (!protocol_.has_method(request->method)) {
            LOG_DEBUG("Ignoring notification: {}", request->method);
            co_return std::nullopt;
        }
        auto result = co_await protocol_.dispatch(*request);
        if (!result) {
            LOG_WARN("Notification {} failed: {}", request->method, result.error().what());
        }
        co_return std::nullopt;
    }

    LOG_DEBUG("Request {}: {}", request->id->dump(), request->method);

    auto result = co_await protocol_.dispatch(*request);
    if (!result) {
        LOG_WARN("Request {} ({}) failed [{}]: {}", request->id->dump(), request->method,
                 error_code_to_string(result.error().code()), result.error().what());
        co_return serialize_response(make_error_response(*request->id, result.error()));
    }
    co_return serialize_response(make_response(*request->id, std::move(*result)));
}

void StdioServer::start_request(net::any_io_executor executor, std::string line) {
    ++in_flight_;
    net::co_spawn(
        executor,
        process(std::move(line)),
        [this](std::exception_ptr e) {
            --in_flight_;
            if (!e) return;
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                LOG_ERROR("Request handling failed: {}", ex.what());
            }
        });
}

auto StdioServer::process(std::string line) -> awaitable<void> {
    auto response = co_await handle_line(line);
    if (response) {
        writer_(*response);
    }
}

auto StdioServer::drain() -> awaitable<void> {
    net::steady_timer timer(co_await net::this_coro::executor);
    while (in_flight_ > 0) {
        timer.expires_after(10ms);
        co_await timer.async_wait(net::use_awaitable);
    }
}

#if defined(BOOST_ASIO_HAS_POSIX_STREAM_DESCRIPTOR)

auto StdioServer::run() -> awaitable<void> {
    auto executor = co_await net::this_coro::executor;

    int fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
        LOG_ERROR("Cannot open stdin for reading");
        co_return;
    }
    net::posix::stream_descriptor input(executor, fd);

    LOG_INFO("Serving MCP over stdio");

    std::string buffer;
    boost::system::error_code ec;
    while (true) {
        auto n = co_await net::async_read_until(
            input, net::dynamic_buffer(buffer), '\n',
            net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec != net::error::eof) {
                LOG_ERROR("stdin read failed: {}", ec.message());
            }
            break;
        }
        auto line = buffer.substr(0, n - 1);
        buffer.erase(0, n);
        start_request(executor, std::move(line));
    }

    // A final line without a newline is still a message.
    if (!utils::trim(buffer).empty()) {
        start_request(executor, std::move(buffer));
    }

    LOG_INFO("stdin closed, finishing {} pending request(s)", in_flight_);
    co_await drain();
}

#else

auto StdioServer::run() -> awaitable<void> {
    auto executor = co_await net::this_coro::executor;

    // std::cin cannot be waited on here, so a detached thread feeds lines
    // to the executor. It may outlive run() if the process is shutting down.
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread([this, executor, done] {
        std::string line;
        while (std::getline(std::cin, line)) {
            net::post(executor, [this, executor, l = std::move(line)]() mutable {
                start_request(executor, std::move(l));
            });
        }
        done->store(true);
    }).detach();

    LOG_INFO("Serving MCP over stdio");

    net::steady_timer timer(executor);
    while (!done->load()) {
        timer.expires_after(50ms);
        co_await timer.async_wait(net::use_awaitable);
    }
    // Let lines posted just before EOF start.
    co_await net::post(executor, net::use_awaitable);

    LOG_INFO("stdin closed, finishing {} pending request(s)", in_flight_);
    co_await drain();
}

#endif

} // namespace execbox::mcp
