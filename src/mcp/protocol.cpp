#include "execbox/mcp/protocol.hpp"

#include "execbox/core/logger.hpp"

namespace execbox::mcp {

void Protocol::register_method(std::string name, MethodHandler handler,
                               std::string description) {
    LOG_DEBUG("Registering method: {}", name);
    methods_[name] = Entry{
        .handler = std::move(handler),
        .info = MethodInfo{
            .name = name,
            .description = std::move(description),
        },
    };
}

auto Protocol::has_method(std::string_view name) const -> bool {
    return methods_.contains(std::string(name));
}

auto Protocol::methods() const -> std::vector<MethodInfo> {
    std::vector<MethodInfo> result;
    result.reserve(methods_.size());
    for (const auto& [_, entry] : methods_) {
        result.push_back(entry.info);
    }
    return result;
}

auto Protocol::dispatch(const RequestFrame& request) -> awaitable<Result<json>> {
    auto it = methods_.find(request.method);
    if (it == methods_.end()) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Method not found",
                                       request.method));
    }

    // JSON type errors come from reading the client's params.
    try {
        co_return co_await it->second.handler(request.params);
    } catch (const json::exception& e) {
        LOG_WARN("Method {} got malformed params: {}", request.method, e.what());
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Invalid params", e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Method {} threw: {}", request.method, e.what());
        co_return make_fail(make_error(ErrorCode::InternalError,
                                       "Method execution failed", e.what()));
    }
}

} // namespace execbox::mcp
