#pragma once

/// @file notification_center.hpp
/// @brief Broadcast facility: named notifications delivered to registered observers
///
/// INotificationCenter is the capability the sequence adapter consumes:
/// register a callback for a name (optionally scoped to one source object),
/// remove it again, and learn when the facility will never call it again.
/// NotificationCenter is the in-process, thread-safe implementation.

#include "fwd.hpp"
#include "notification.hpp"
#include <beacon/core/error.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace beacon_core {
class ConfigManager;
}

namespace beacon_event {

// =============================================================================
// ObserverToken
// =============================================================================

/// Identifies one registered observer
struct ObserverToken {
    std::uint64_t id = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr bool operator==(const ObserverToken&) const noexcept = default;
};

/// Called for every matching notification
using ObserverCallback = std::function<void(const Notification&)>;

/// Called once when the facility will never deliver to the observer again
using CompletionCallback = std::function<void()>;

// =============================================================================
// INotificationCenter
// =============================================================================

/// Broadcast facility interface
///
/// Guarantees to observers:
/// - on_notify runs zero or more times, on any thread, after registration
/// - once remove_observer() returns, on_notify will not start again; when
///   called outside any callback it also waits for running deliveries
/// - callbacks may add or remove observers, including their own
/// - on_complete runs at most once, after which the observer is gone
class INotificationCenter {
public:
    virtual ~INotificationCenter() = default;

    /// Register an observer for `name`, limited to notifications from
    /// `source` when one is given
    [[nodiscard]] virtual beacon_core::Result<ObserverToken> add_observer(
        NotificationName name,
        std::optional<SourceRef> source,
        ObserverCallback on_notify,
        CompletionCallback on_complete = {}) = 0;

    /// Unregister an observer. NotFound once removed or completed.
    virtual beacon_core::Result<void> remove_observer(ObserverToken token) = 0;
};

// =============================================================================
// NotificationCenter
// =============================================================================

/// Configuration for a NotificationCenter
struct CenterConfig {
    std::string name = "default";
    std::size_t max_observers = 0;  ///< 0 = unlimited
    bool log_posts = false;         ///< Log every post at debug level

    /// Build from `center.name`, `center.max_observers`, `center.log_posts`
    [[nodiscard]] static CenterConfig from_config(const beacon_core::ConfigManager& config);
};

/// Counters for a NotificationCenter
struct CenterStats {
    std::uint64_t posted = 0;
    std::uint64_t delivered = 0;
    std::uint64_t registered = 0;
    std::uint64_t removed = 0;
    std::uint64_t completed = 0;
    std::size_t active_observers = 0;
};

/// In-process notification center
///
/// post() delivers synchronously on the posting thread, in registration
/// order, with no center lock held. Concurrent posts may deliver to the
/// same observer at the same time.
class NotificationCenter : public INotificationCenter {
public:
    using Config = CenterConfig;

    NotificationCenter();
    explicit NotificationCenter(CenterConfig config);

    /// Completes every remaining observer
    ~NotificationCenter() override;

    NotificationCenter(const NotificationCenter&) = delete;
    NotificationCenter& operator=(const NotificationCenter&) = delete;

    /// Create a shared center (sequences hold it through shared_ptr)
    [[nodiscard]] static std::shared_ptr<NotificationCenter> create(CenterConfig config = {});

    // =========================================================================
    // INotificationCenter
    // =========================================================================

    [[nodiscard]] beacon_core::Result<ObserverToken> add_observer(
        NotificationName name,
        std::optional<SourceRef> source,
        ObserverCallback on_notify,
        CompletionCallback on_complete = {}) override;

    beacon_core::Result<void> remove_observer(ObserverToken token) override;

    // =========================================================================
    // Posting
    // =========================================================================

    /// Deliver to every observer of the name whose source filter is absent
    /// or equal to the notification's source
    /// @return Number of observers notified
    std::size_t post(const Notification& notification);

    std::size_t post(NotificationName name, std::optional<SourceRef> source = std::nullopt, UserInfo payload = {});

    // =========================================================================
    // Teardown
    // =========================================================================

    /// Complete and drop every observer scoped to `source`
    /// @return Number of observers completed
    std::size_t retire_source(SourceRef source);

    /// Complete every observer and refuse new ones. Idempotent.
    void shutdown();

    [[nodiscard]] bool is_shut_down() const;

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] std::size_t observer_count() const;
    [[nodiscard]] std::size_t observer_count(const NotificationName& name) const;
    [[nodiscard]] CenterStats stats() const;
    [[nodiscard]] const CenterConfig& config() const noexcept { return m_config; }

private:
    struct ObserverEntry;

    /// Mark entries inactive and run their completion callbacks
    std::size_t complete_entries(std::vector<std::shared_ptr<ObserverEntry>> entries);

    /// Stop new deliveries to `entry`; waits for running ones unless the
    /// calling thread is itself inside a delivery
    static void deactivate(ObserverEntry& entry);

    /// Run on_notify unless the entry was deactivated
    static bool deliver(ObserverEntry& entry, const Notification& notification);

    CenterConfig m_config;

    mutable std::mutex m_mutex;
    std::vector<std::shared_ptr<ObserverEntry>> m_observers;
    bool m_shut_down = false;

    std::atomic<std::uint64_t> m_next_token{1};
    std::atomic<std::uint64_t> m_next_sequence{1};

    std::atomic<std::uint64_t> m_posted{0};
    std::atomic<std::uint64_t> m_delivered{0};
    std::atomic<std::uint64_t> m_registered{0};
    std::atomic<std::uint64_t> m_removed{0};
    std::atomic<std::uint64_t> m_completed{0};
};

} // namespace beacon_event

template<>
struct std::hash<beacon_event::ObserverToken> {
    std::size_t operator()(const beacon_event::ObserverToken& token) const noexcept {
        return std::hash<std::uint64_t>{}(token.id);
    }
};
