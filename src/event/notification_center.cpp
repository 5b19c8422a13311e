/// @file notification_center.cpp
/// @brief In-process NotificationCenter implementation

#include <beacon/event/notification_center.hpp>
#include <beacon/core/config.hpp>
#include <beacon/core/log.hpp>

#include <algorithm>
#include <condition_variable>
#include <vector>

namespace beacon_event {

// =============================================================================
// ObserverEntry
// =============================================================================

struct NotificationCenter::ObserverEntry {
    ObserverToken token;
    NotificationName name;
    std::optional<SourceRef> source;
    ObserverCallback on_notify;
    CompletionCallback on_complete;

    std::mutex state_mutex;
    std::condition_variable idle;
    std::size_t in_flight = 0;  // guarded by state_mutex
    bool active = true;         // guarded by state_mutex

    [[nodiscard]] bool matches(const Notification& notification) const {
        if (name != notification.name()) {
            return false;
        }
        return !source || source == notification.source();
    }
};

namespace {

/// Number of deliveries the current thread is inside of, on any center
thread_local std::size_t t_delivery_depth = 0;

struct DeliveryDepth {
    DeliveryDepth() noexcept { ++t_delivery_depth; }
    ~DeliveryDepth() { --t_delivery_depth; }

    DeliveryDepth(const DeliveryDepth&) = delete;
    DeliveryDepth& operator=(const DeliveryDepth&) = delete;
};

} // namespace

void NotificationCenter::deactivate(ObserverEntry& entry) {
    std::unique_lock<std::mutex> lock(entry.state_mutex);
    entry.active = false;

    // Inside a callback we may be the delivery being waited for, or another
    // thread may be waiting on ours; never block there.
    if (t_delivery_depth == 0) {
        entry.idle.wait(lock, [&entry] { return entry.in_flight == 0; });
    }
}

bool NotificationCenter::deliver(ObserverEntry& entry, const Notification& notification) {
    {
        std::lock_guard<std::mutex> lock(entry.state_mutex);
        if (!entry.active) {
            return false;
        }
        ++entry.in_flight;
    }

    struct InFlight {
        ObserverEntry& entry;
        ~InFlight() {
            std::lock_guard<std::mutex> lock(entry.state_mutex);
            if (--entry.in_flight == 0) {
                entry.idle.notify_all();
            }
        }
    } in_flight{entry};

    DeliveryDepth depth;
    entry.on_notify(notification);
    return true;
}

// =============================================================================
// CenterConfig
// =============================================================================

CenterConfig CenterConfig::from_config(const beacon_core::ConfigManager& config) {
    CenterConfig result;
    result.name = config.get_string(beacon_core::config_keys::CENTER_NAME, result.name);
    auto max_observers = config.get_int(beacon_core::config_keys::CENTER_MAX_OBSERVERS, 0);
    result.max_observers = max_observers > 0 ? static_cast<std::size_t>(max_observers) : 0;
    result.log_posts = config.get_bool(beacon_core::config_keys::CENTER_LOG_POSTS, result.log_posts);
    return result;
}

// =============================================================================
// NotificationCenter
// =============================================================================

NotificationCenter::NotificationCenter() : m_config{} {}

NotificationCenter::NotificationCenter(CenterConfig config) : m_config(std::move(config)) {}

NotificationCenter::~NotificationCenter() {
    shutdown();
}

std::shared_ptr<NotificationCenter> NotificationCenter::create(CenterConfig config) {
    return std::make_shared<NotificationCenter>(std::move(config));
}

beacon_core::Result<ObserverToken> NotificationCenter::add_observer(
    NotificationName name,
    std::optional<SourceRef> source,
    ObserverCallback on_notify,
    CompletionCallback on_complete)
{
    auto fail = [](beacon_core::Error error) -> beacon_core::Result<ObserverToken> {
        beacon_core::debug::record_error(error);
        beacon_core::event_logger()->warn("add_observer failed: {}", error.message());
        return error;
    };

    if (name.empty()) {
        return fail(beacon_core::SubscriptionError::empty_name());
    }
    if (!on_notify) {
        return fail(beacon_core::SubscriptionError::empty_callback(name));
    }

    auto entry = std::make_shared<ObserverEntry>();
    entry->name = std::move(name);
    entry->source = source;
    entry->on_notify = std::move(on_notify);
    entry->on_complete = std::move(on_complete);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shut_down) {
            return fail(beacon_core::SubscriptionError::center_shut_down(m_config.name, entry->name));
        }
        if (m_config.max_observers != 0 && m_observers.size() >= m_config.max_observers) {
            return fail(beacon_core::SubscriptionError::limit_reached(entry->name, m_config.max_observers));
        }

        entry->token = ObserverToken{m_next_token.fetch_add(1, std::memory_order_relaxed)};
        m_observers.push_back(entry);
    }

    m_registered.fetch_add(1, std::memory_order_relaxed);
    beacon_core::event_logger()->debug("[{}] observer {} added for '{}'{}",
        m_config.name, entry->token.id, entry->name, entry->source ? " (source-scoped)" : "");

    return entry->token;
}

beacon_core::Result<void> NotificationCenter::remove_observer(ObserverToken token) {
    std::shared_ptr<ObserverEntry> entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_observers.begin(), m_observers.end(),
            [token](const auto& e) { return e->token == token; });
        if (it == m_observers.end()) {
            return beacon_core::Error{beacon_core::SubscriptionError::not_found(token.id)};
        }
        entry = std::move(*it);
        m_observers.erase(it);
    }

    deactivate(*entry);

    m_removed.fetch_add(1, std::memory_order_relaxed);
    beacon_core::event_logger()->debug("[{}] observer {} removed from '{}'",
        m_config.name, token.id, entry->name);

    return beacon_core::Ok();
}

std::size_t NotificationCenter::post(const Notification& notification) {
    std::vector<std::shared_ptr<ObserverEntry>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shut_down) {
            return 0;
        }
        for (const auto& entry : m_observers) {
            if (entry->matches(notification)) {
                targets.push_back(entry);
            }
        }
    }

    auto stamped = notification.stamped(m_next_sequence.fetch_add(1, std::memory_order_relaxed));
    m_posted.fetch_add(1, std::memory_order_relaxed);

    if (m_config.log_posts) {
        beacon_core::event_logger()->debug("[{}] post '{}' #{} to {} observer(s)",
            m_config.name, stamped.name(), stamped.sequence_number(), targets.size());
    }

    std::size_t notified = 0;
    for (const auto& entry : targets) {
        if (deliver(*entry, stamped)) {
            ++notified;
        }
    }

    m_delivered.fetch_add(notified, std::memory_order_relaxed);
    return notified;
}

std::size_t NotificationCenter::post(NotificationName name, std::optional<SourceRef> source, UserInfo payload) {
    return post(Notification(std::move(name), source, std::move(payload)));
}

std::size_t NotificationCenter::retire_source(SourceRef source) {
    std::vector<std::shared_ptr<ObserverEntry>> retired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::stable_partition(m_observers.begin(), m_observers.end(),
            [source](const auto& e) { return e->source != source; });
        retired.assign(std::make_move_iterator(it), std::make_move_iterator(m_observers.end()));
        m_observers.erase(it, m_observers.end());
    }

    if (!retired.empty()) {
        beacon_core::event_logger()->info("[{}] retiring {} observer(s) of {}",
            m_config.name, retired.size(), source.address());
    }

    return complete_entries(std::move(retired));
}

void NotificationCenter::shutdown() {
    std::vector<std::shared_ptr<ObserverEntry>> remaining;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shut_down) {
            return;
        }
        m_shut_down = true;
        remaining.swap(m_observers);
    }

    beacon_core::event_logger()->info("[{}] shutting down, completing {} observer(s)",
        m_config.name, remaining.size());

    complete_entries(std::move(remaining));
}

bool NotificationCenter::is_shut_down() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shut_down;
}

std::size_t NotificationCenter::complete_entries(std::vector<std::shared_ptr<ObserverEntry>> entries) {
    std::size_t completed = 0;
    for (const auto& entry : entries) {
        deactivate(*entry);

        if (entry->on_complete) {
            entry->on_complete();
        }
        ++completed;
    }

    m_completed.fetch_add(completed, std::memory_order_relaxed);
    return completed;
}

std::size_t NotificationCenter::observer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_observers.size();
}

std::size_t NotificationCenter::observer_count(const NotificationName& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::size_t>(std::count_if(m_observers.begin(), m_observers.end(),
        [&name](const auto& e) { return e->name == name; }));
}

CenterStats NotificationCenter::stats() const {
    CenterStats s;
    s.posted = m_posted.load(std::memory_order_relaxed);
    s.delivered = m_delivered.load(std::memory_order_relaxed);
    s.registered = m_registered.load(std::memory_order_relaxed);
    s.removed = m_removed.load(std::memory_order_relaxed);
    s.completed = m_completed.load(std::memory_order_relaxed);
    s.active_observers = observer_count();
    return s;
}

} // namespace beacon_event
