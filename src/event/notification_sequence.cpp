/// @file notification_sequence.cpp
/// @brief NotificationSequence and NotificationIterator implementation

#include <beacon/event/notification_sequence.hpp>
#include <beacon/core/log.hpp>

namespace beacon_event {

// =============================================================================
// NotificationIterator
// =============================================================================

NotificationIterator::NotificationIterator(std::shared_ptr<Buffer> buffer, ObserverGuard guard, NotificationName name)
    : m_buffer(std::move(buffer))
    , m_guard(std::move(guard))
    , m_name(std::move(name)) {}

NotificationIterator::NotificationIterator(NotificationIterator&& other) noexcept
    : m_buffer(std::move(other.m_buffer))
    , m_guard(std::move(other.m_guard))
    , m_name(std::move(other.m_name))
    , m_finished(other.m_finished.exchange(true)) {}

NotificationIterator::~NotificationIterator() {
    teardown();
}

NotificationIterator& NotificationIterator::operator=(NotificationIterator&& other) noexcept {
    if (this != &other) {
        teardown();
        m_buffer = std::move(other.m_buffer);
        m_guard = std::move(other.m_guard);
        m_name = std::move(other.m_name);
        m_finished.store(other.m_finished.exchange(true));
    }
    return *this;
}

std::optional<Notification> NotificationIterator::wait_next() {
    return unwrap(m_buffer->wait_next());
}

std::optional<Notification> NotificationIterator::wait_next_for(std::chrono::milliseconds timeout) {
    return unwrap(m_buffer->wait_next_for(timeout));
}

void NotificationIterator::cancel() {
    if (!m_buffer) {
        return;
    }
    beacon_core::event_logger()->debug("iterator for '{}' cancelled", m_name);
    m_guard.reset();
    m_buffer->close();
}

std::size_t NotificationIterator::pending_count() const {
    return m_buffer ? m_buffer->pending_count() : 0;
}

std::optional<Notification> NotificationIterator::unwrap(std::optional<Element> element) {
    if (!element) {
        // Timeouts and rejected concurrent takes also come back empty
        if (m_buffer->drained()) {
            finish();
        }
        return std::nullopt;
    }
    return std::move(*element).take();
}

void NotificationIterator::finish() {
    // cancel() on another thread may be resetting the guard too; the guard
    // hands its token to only one of us
    if (m_finished.exchange(true)) {
        return;
    }
    m_guard.reset();
    beacon_core::event_logger()->trace("iterator for '{}' finished", m_name);
}

void NotificationIterator::teardown() noexcept {
    // Moved-from iterators own nothing
    if (!m_buffer) {
        return;
    }
    m_guard.reset();
    m_buffer->close();
}

// =============================================================================
// NotificationSequence
// =============================================================================

NotificationSequence::NotificationSequence(
    std::shared_ptr<INotificationCenter> center,
    NotificationName name,
    std::optional<SourceRef> source)
    : m_center(std::move(center))
    , m_name(std::move(name))
    , m_source(source) {}

beacon_core::Result<NotificationIterator> NotificationSequence::make_iterator() const {
    if (!m_center) {
        beacon_core::Error error{beacon_core::SubscriptionError::no_center(m_name)};
        beacon_core::debug::record_error(error);
        beacon_core::event_logger()->warn("make_iterator failed: {}", error.message());
        return error;
    }

    auto buffer = std::make_shared<NotificationIterator::Buffer>();

    // The center may outlive the iterator; it only ever sees a weak handle
    std::weak_ptr<NotificationIterator::Buffer> weak = buffer;

    auto token = m_center->add_observer(
        m_name,
        m_source,
        [weak](const Notification& notification) {
            if (auto target = weak.lock()) {
                target->push(NotificationIterator::Element(notification));
            }
        },
        [weak]() {
            if (auto target = weak.lock()) {
                target->close();
            }
        });

    if (token.is_err()) {
        return beacon_core::Error{token.error()}.with_context("event", m_name);
    }

    beacon_core::event_logger()->debug("iterator created for '{}' (observer {})", m_name, token.value().id);

    ObserverGuard guard(std::weak_ptr<INotificationCenter>(m_center), token.value());
    return NotificationIterator(std::move(buffer), std::move(guard), m_name);
}

NotificationSequence sequence(
    std::shared_ptr<INotificationCenter> center,
    NotificationName name,
    std::optional<SourceRef> source)
{
    return NotificationSequence(std::move(center), std::move(name), source);
}

} // namespace beacon_event
