#pragma once

#include <memory>
#include <mutex>

#include "execbox/security/policy.hpp"

namespace execbox::security {

/// Holds the active policy. Readers take a snapshot per request; a reload
/// swaps in a whole new policy object and never touches the old one, so a
/// request that already holds a snapshot finishes under the rules it started
/// with.
class PolicyStore {
public:
    explicit PolicyStore(std::shared_ptr<const SecurityPolicy> initial);

    [[nodiscard]] auto current() const -> std::shared_ptr<const SecurityPolicy>;

    void replace(std::shared_ptr<const SecurityPolicy> next);

    /// Reloads from `path`. On failure the current policy stays in place.
    auto reload(const std::filesystem::path& path) -> VoidResult;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const SecurityPolicy> policy_;
};

} // namespace execbox::security
