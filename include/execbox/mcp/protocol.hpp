#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include "execbox/core/error.hpp"
#include "execbox/mcp/frame.hpp"

namespace execbox::mcp {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Signature for an RPC method handler.
/// Receives params as JSON, returns the result or an error.
using MethodHandler = std::function<awaitable<Result<json>>(json params)>;

struct MethodInfo {
    std::string name;
    std::string description;
};

/// Method registration and dispatch for incoming requests.
class Protocol {
public:
    Protocol() = default;

    /// Register a method handler, replacing any handler of the same name.
    void register_method(std::string name, MethodHandler handler,
                         std::string description = "");

    [[nodiscard]] auto has_method(std::string_view name) const -> bool;

    [[nodiscard]] auto methods() const -> std::vector<MethodInfo>;

    /// Dispatch a request to the matching handler.
    /// Fails with NotFound for an unknown method. A handler throwing a JSON
    /// type error fails with InvalidArgument, any other exception with
    /// InternalError.
    auto dispatch(const RequestFrame& request) -> awaitable<Result<json>>;

private:
    struct Entry {
        MethodHandler handler;
        MethodInfo info;
    };

    std::unordered_map<std::string, Entry> methods_;
};

} // namespace execbox::mcp
