#pragma once

/// @file observer_guard.hpp
/// @brief RAII ownership of one observer registration

#include "fwd.hpp"
#include "notification_center.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>

namespace beacon_event {

/// RAII guard that removes its observer exactly once
///
/// Removal happens on reset(), on destruction, or when another guard is
/// move-assigned over a live one. Removal failures are logged and
/// swallowed; a center that no longer exists is skipped.
///
/// reset(), release() and is_active() may race each other from different
/// threads; only one caller gets the token. Moves are not synchronized.
class ObserverGuard {
public:
    ObserverGuard() = default;

    ObserverGuard(std::weak_ptr<INotificationCenter> center, ObserverToken token)
        : m_center(std::move(center)), m_token_id(token.id) {}

    ~ObserverGuard() {
        reset();
    }

    // Move-only
    ObserverGuard(ObserverGuard&& other) noexcept
        : m_center(std::move(other.m_center)), m_token_id(other.m_token_id.exchange(0)) {}

    ObserverGuard& operator=(ObserverGuard&& other) noexcept {
        if (this != &other) {
            reset();
            m_center = std::move(other.m_center);
            m_token_id.store(other.m_token_id.exchange(0));
        }
        return *this;
    }

    ObserverGuard(const ObserverGuard&) = delete;
    ObserverGuard& operator=(const ObserverGuard&) = delete;

    /// Remove the observer now (no-op if already removed)
    void reset() noexcept;

    /// Give up ownership without removing
    ObserverToken release() noexcept {
        return ObserverToken{m_token_id.exchange(0)};
    }

    [[nodiscard]] bool is_active() const noexcept { return m_token_id.load() != 0; }
    [[nodiscard]] ObserverToken token() const noexcept { return ObserverToken{m_token_id.load()}; }

private:
    // Never written after construction except by moves
    std::weak_ptr<INotificationCenter> m_center;
    std::atomic<std::uint64_t> m_token_id{0};
};

} // namespace beacon_event
