#pragma once

/// @file notification_sequence.hpp
/// @brief Pull-based asynchronous sequence over a notification center
///
/// ```cpp
/// auto center = NotificationCenter::create();
/// auto ticks = sequence(center, "tick");
///
/// Task<void> consume(NotificationSequence ticks) {
///     auto it = ticks.make_iterator();
///     if (!it) {
///         co_return;  // registration failed, see it.error()
///     }
///     while (auto n = co_await it->next()) {
///         // Handle *n
///     }
/// }
/// ```
///
/// Each iterator owns its own buffer and its own observer registration,
/// made when the iterator is created. Events posted earlier are not seen.

#include "fwd.hpp"
#include "notification.hpp"
#include "notification_center.hpp"
#include "observer_guard.hpp"
#include <beacon/core/error.hpp>
#include <beacon/stream/async_buffer.hpp>
#include <beacon/stream/unsafe_sendable.hpp>

#include <atomic>
#include <chrono>
#include <coroutine>
#include <memory>
#include <optional>

namespace beacon_event {

// =============================================================================
// NotificationIterator
// =============================================================================

/// Single-use, forward-only cursor over one observer registration
///
/// The registration is removed when the sequence ends (the center completes
/// the observer), on cancel(), or when the iterator is destroyed early.
/// Not restartable; create a new iterator for a new window.
class NotificationIterator {
public:
    using Element = beacon_stream::UnsafeSendable<Notification>;
    using Buffer = beacon_stream::AsyncBuffer<Element>;

    /// Awaitable returned by next(); `co_await` yields std::optional<Notification>
    class NextAwaitable {
    public:
        explicit NextAwaitable(NotificationIterator& iterator)
            : m_iterator(iterator), m_inner(iterator.m_buffer->next()) {}

        bool await_ready() { return m_inner.await_ready(); }

        bool await_suspend(std::coroutine_handle<> handle) {
            return m_inner.await_suspend(handle);
        }

        std::optional<Notification> await_resume() {
            return m_iterator.unwrap(m_inner.await_resume());
        }

    private:
        NotificationIterator& m_iterator;
        Buffer::NextAwaitable m_inner;
    };

    ~NotificationIterator();

    NotificationIterator(NotificationIterator&& other) noexcept;
    NotificationIterator& operator=(NotificationIterator&& other) noexcept;

    NotificationIterator(const NotificationIterator&) = delete;
    NotificationIterator& operator=(const NotificationIterator&) = delete;

    // =========================================================================
    // Pulling
    // =========================================================================

    /// Next notification, suspending while none is pending.
    /// std::nullopt marks the end of the sequence.
    [[nodiscard]] NextAwaitable next() { return NextAwaitable(*this); }

    /// Blocking variant of next()
    [[nodiscard]] std::optional<Notification> wait_next();

    /// Blocking variant with timeout. std::nullopt on timeout too;
    /// is_finished() is only set at the real end.
    [[nodiscard]] std::optional<Notification> wait_next_for(std::chrono::milliseconds timeout);

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Stop observing. Already buffered notifications are still delivered,
    /// then the sequence ends. Safe to call from any thread, including while
    /// another thread is pulling.
    void cancel();

    /// The observer registration is still live
    [[nodiscard]] bool is_subscribed() const noexcept { return m_guard.is_active(); }

    /// End of sequence has been delivered
    [[nodiscard]] bool is_finished() const noexcept { return m_finished.load(); }

    [[nodiscard]] const NotificationName& name() const noexcept { return m_name; }

    /// Notifications received but not yet pulled
    [[nodiscard]] std::size_t pending_count() const;

private:
    friend class NotificationSequence;

    NotificationIterator(std::shared_ptr<Buffer> buffer, ObserverGuard guard, NotificationName name);

    std::optional<Notification> unwrap(std::optional<Element> element);
    void finish();
    void teardown() noexcept;

    std::shared_ptr<Buffer> m_buffer;
    ObserverGuard m_guard;
    NotificationName m_name;
    std::atomic<bool> m_finished{false};
};

// =============================================================================
// NotificationSequence
// =============================================================================

/// Adapter describing which notifications to observe
///
/// Holds no per-iteration state: every make_iterator() call registers a
/// fresh observer with a fresh buffer.
class NotificationSequence {
public:
    NotificationSequence(
        std::shared_ptr<INotificationCenter> center,
        NotificationName name,
        std::optional<SourceRef> source = std::nullopt);

    /// Register an observer and return an iterator bound to it.
    /// Registration failures are returned, never turned into an empty sequence.
    [[nodiscard]] beacon_core::Result<NotificationIterator> make_iterator() const;

    [[nodiscard]] const NotificationName& name() const noexcept { return m_name; }
    [[nodiscard]] const std::optional<SourceRef>& source() const noexcept { return m_source; }
    [[nodiscard]] const std::shared_ptr<INotificationCenter>& center() const noexcept { return m_center; }

private:
    std::shared_ptr<INotificationCenter> m_center;
    NotificationName m_name;
    std::optional<SourceRef> m_source;
};

/// Sequence of `name` notifications posted to `center`, optionally only
/// those from `source`
[[nodiscard]] NotificationSequence sequence(
    std::shared_ptr<INotificationCenter> center,
    NotificationName name,
    std::optional<SourceRef> source = std::nullopt);

} // namespace beacon_event
