#include "execbox/security/policy_store.hpp"

#include "execbox/core/logger.hpp"

namespace execbox::security {

PolicyStore::PolicyStore(std::shared_ptr<const SecurityPolicy> initial)
    : policy_(std::move(initial)) {}

auto PolicyStore::current() const -> std::shared_ptr<const SecurityPolicy> {
    std::lock_guard lock(mutex_);
    return policy_;
}

void PolicyStore::replace(std::shared_ptr<const SecurityPolicy> next) {
    if (!next) {
        LOG_WARN("Ignoring attempt to install a null policy");
        return;
    }
    std::lock_guard lock(mutex_);
    policy_ = std::move(next);
}

auto PolicyStore::reload(const std::filesystem::path& path) -> VoidResult {
    auto next = load_policy(path);
    if (!next) {
        LOG_ERROR("Policy reload failed, keeping current policy: {}", next.error().what());
        return std::unexpected(next.error());
    }
    replace(std::move(*next));
    LOG_INFO("Policy reloaded from {}", path.string());
    return {};
}

} // namespace execbox::security
