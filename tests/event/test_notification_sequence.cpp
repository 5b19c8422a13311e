/// @file test_notification_sequence.cpp
/// @brief Tests for NotificationSequence and NotificationIterator

#include <catch2/catch_test_macros.hpp>
#include <beacon/event/event.hpp>
#include <beacon/stream/task.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using namespace beacon_event;
using namespace std::chrono_literals;
using beacon_stream::Task;
using beacon_stream::sync_wait;

namespace {

/// Scriptable center that records every registration it hands out
class FakeNotificationCenter : public INotificationCenter {
public:
    struct Registration {
        NotificationName name;
        std::optional<SourceRef> source;
        ObserverCallback on_notify;
        CompletionCallback on_complete;
    };

    beacon_core::Result<ObserverToken> add_observer(
        NotificationName name,
        std::optional<SourceRef> source,
        ObserverCallback on_notify,
        CompletionCallback on_complete = {}) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++add_calls;
        if (fail_next_add) {
            fail_next_add = false;
            return beacon_core::Error{beacon_core::SubscriptionError::limit_reached(name, 0)};
        }
        ObserverToken token{m_next_id++};
        m_live[token.id] = Registration{std::move(name), source, std::move(on_notify), std::move(on_complete)};
        return token;
    }

    beacon_core::Result<void> remove_observer(ObserverToken token) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++remove_calls;
        if (m_live.erase(token.id) == 0) {
            return beacon_core::Error{beacon_core::SubscriptionError::not_found(token.id)};
        }
        return beacon_core::Ok();
    }

    /// Deliver to every live registration for the name; returns the count
    std::size_t fire(const Notification& notification) {
        std::vector<ObserverCallback> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& [id, registration] : m_live) {
                if (registration.name == notification.name() &&
                    (!registration.source || registration.source == notification.source())) {
                    targets.push_back(registration.on_notify);
                }
            }
        }
        for (const auto& target : targets) {
            target(notification);
        }
        return targets.size();
    }

    /// Complete and drop every live registration
    void complete_all() {
        std::map<std::uint64_t, Registration> completed;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            completed.swap(m_live);
        }
        for (auto& [id, registration] : completed) {
            if (registration.on_complete) {
                registration.on_complete();
            }
        }
    }

    /// Complete every live registration but leave it registered, so only
    /// the iterator can remove it
    void close_all() {
        std::vector<CompletionCallback> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& [id, registration] : m_live) {
                targets.push_back(registration.on_complete);
            }
        }
        for (const auto& target : targets) {
            if (target) {
                target();
            }
        }
    }

    std::size_t live_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_live.size();
    }

    bool fail_next_add = false;
    int add_calls = 0;
    int remove_calls = 0;

private:
    mutable std::mutex m_mutex;
    std::map<std::uint64_t, Registration> m_live;
    std::uint64_t m_next_id = 1;
};

Notification tick(std::int64_t n) {
    return Notification("tick", std::nullopt, UserInfo{{"n", n}});
}

std::int64_t tick_value(const Notification& notification) {
    const auto* n = notification.get<std::int64_t>("n");
    return n ? *n : -1;
}

Task<std::vector<std::int64_t>> collect_ticks(NotificationIterator& iterator) {
    std::vector<std::int64_t> values;
    while (auto notification = co_await iterator.next()) {
        values.push_back(tick_value(*notification));
    }
    co_return values;
}

template<typename Predicate>
void wait_until(Predicate predicate) {
    while (!predicate()) {
        std::this_thread::sleep_for(1ms);
    }
}

} // namespace

// =============================================================================
// Registration
// =============================================================================

TEST_CASE("NotificationSequence: registers when the iterator is created", "[event][sequence]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    auto ticks = sequence(center, "tick");

    REQUIRE(ticks.name() == "tick");
    REQUIRE_FALSE(ticks.source().has_value());
    REQUIRE(center->live_count() == 0);

    // Posted before any iterator exists: nobody sees it
    REQUIRE(center->fire(tick(0)) == 0);

    auto iterator = ticks.make_iterator();
    REQUIRE(iterator.is_ok());
    REQUIRE(iterator->is_subscribed());
    REQUIRE(iterator->name() == "tick");
    REQUIRE(center->live_count() == 1);
    REQUIRE(iterator->pending_count() == 0);
}

TEST_CASE("NotificationSequence: registration failure is reported", "[event][sequence]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    center->fail_next_add = true;

    auto iterator = sequence(center, "tick").make_iterator();
    REQUIRE(iterator.is_err());
    REQUIRE(iterator.error().code() == beacon_core::ErrorCode::LimitReached);
    REQUIRE(iterator.error().get_context("event") != nullptr);
    REQUIRE(center->live_count() == 0);
}

TEST_CASE("NotificationSequence: missing center is reported", "[event][sequence]") {
    auto iterator = sequence(nullptr, "tick").make_iterator();
    REQUIRE(iterator.is_err());
    REQUIRE(iterator.error().as<beacon_core::SubscriptionError>()->kind ==
            beacon_core::SubscriptionError::Kind::NoCenter);
}

// =============================================================================
// Delivery
// =============================================================================

TEST_CASE("NotificationIterator: delivers in order then ends on completion", "[event][sequence]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    auto iterator = sequence(center, "tick").make_iterator().unwrap();

    center->fire(tick(1));
    center->fire(tick(2));
    center->complete_all();

    auto first = iterator.wait_next();
    REQUIRE(first.has_value());
    REQUIRE(first->name() == "tick");
    REQUIRE(tick_value(*first) == 1);

    auto second = iterator.wait_next();
    REQUIRE(second.has_value());
    REQUIRE(tick_value(*second) == 2);

    REQUIRE_FALSE(iterator.wait_next().has_value());
    REQUIRE(iterator.is_finished());
    REQUIRE_FALSE(iterator.is_subscribed());

    // The end is sticky
    REQUIRE_FALSE(iterator.wait_next().has_value());
}

TEST_CASE("NotificationIterator: coroutine consumer", "[event][sequence][coro]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    auto iterator = sequence(center, "tick").make_iterator().unwrap();

    std::thread producer([center] {
        for (std::int64_t n = 1; n <= 3; ++n) {
            center->fire(tick(n));
        }
        center->complete_all();
    });

    auto values = sync_wait(collect_ticks(iterator));
    producer.join();

    REQUIRE(values == std::vector<std::int64_t>{1, 2, 3});
    REQUIRE(iterator.is_finished());
}

TEST_CASE("NotificationIterator: tick before and during a pull", "[event][sequence][coro]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    auto iterator = sequence(center, "tick").make_iterator().unwrap();
    std::atomic<bool> first_received{false};

    auto consume_two = [&]() -> Task<std::vector<std::int64_t>> {
        std::vector<std::int64_t> values;
        auto first = co_await iterator.next();
        values.push_back(first ? tick_value(*first) : -1);
        first_received = true;
        auto second = co_await iterator.next();
        values.push_back(second ? tick_value(*second) : -1);
        co_return values;
    };

    // Before the first pull
    center->fire(tick(1));

    std::thread producer([&] {
        wait_until([&] { return first_received.load(); });
        std::this_thread::sleep_for(10ms);
        center->fire(tick(2));
    });

    auto values = sync_wait(consume_two());
    producer.join();

    REQUIRE(values == std::vector<std::int64_t>{1, 2});
    REQUIRE(iterator.is_subscribed());
}

TEST_CASE("NotificationIterator: independent iterators", "[event][sequence]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    auto ticks = sequence(center, "tick");

    auto first = ticks.make_iterator().unwrap();
    center->fire(tick(1));
    auto second = ticks.make_iterator().unwrap();
    center->fire(tick(2));

    REQUIRE(center->live_count() == 2);
    REQUIRE(first.pending_count() == 2);
    REQUIRE(second.pending_count() == 1);

    REQUIRE(tick_value(*first.wait_next()) == 1);
    REQUIRE(tick_value(*second.wait_next()) == 2);
}

TEST_CASE("NotificationIterator: source filter", "[event][sequence]") {
    auto center = NotificationCenter::create();
    int sender = 0;
    int other = 0;

    auto iterator = sequence(center, "tick", SourceRef::of(sender)).make_iterator().unwrap();

    center->post("tick", SourceRef::of(other), UserInfo{{"n", std::int64_t(1)}});
    center->post("tick", SourceRef::of(sender), UserInfo{{"n", std::int64_t(2)}});

    REQUIRE(iterator.pending_count() == 1);
    auto notification = iterator.wait_next();
    REQUIRE(tick_value(*notification) == 2);
    REQUIRE(notification->source() == SourceRef::of(sender));
}

TEST_CASE("NotificationIterator: wait_next_for", "[event][sequence]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    auto iterator = sequence(center, "tick").make_iterator().unwrap();

    REQUIRE_FALSE(iterator.wait_next_for(10ms).has_value());
    REQUIRE_FALSE(iterator.is_finished());
    REQUIRE(iterator.is_subscribed());

    center->fire(tick(5));
    auto value = iterator.wait_next_for(10ms);
    REQUIRE(value.has_value());
    REQUIRE(tick_value(*value) == 5);

    center->complete_all();
    REQUIRE_FALSE(iterator.wait_next_for(10ms).has_value());
    REQUIRE(iterator.is_finished());
}

// =============================================================================
// Teardown
// =============================================================================

TEST_CASE("NotificationIterator: dropping the iterator removes the observer", "[event][sequence]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    {
        auto iterator = sequence(center, "tick").make_iterator().unwrap();
        center->fire(tick(1));
        REQUIRE(center->live_count() == 1);
    }
    REQUIRE(center->live_count() == 0);
    REQUIRE(center->remove_calls == 1);

    // Nothing is listening any more
    REQUIRE(center->fire(tick(2)) == 0);
}

TEST_CASE("NotificationIterator: cancel", "[event][sequence]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    auto iterator = sequence(center, "tick").make_iterator().unwrap();

    center->fire(tick(1));
    iterator.cancel();

    REQUIRE_FALSE(iterator.is_subscribed());
    REQUIRE(center->live_count() == 0);

    // Buffered before cancel, still delivered
    auto buffered = iterator.wait_next();
    REQUIRE(buffered.has_value());
    REQUIRE(tick_value(*buffered) == 1);
    REQUIRE_FALSE(iterator.wait_next().has_value());
    REQUIRE(iterator.is_finished());

    // Cancelling twice or destroying afterwards does not remove again
    iterator.cancel();
    REQUIRE(center->remove_calls == 1);
}

TEST_CASE("NotificationIterator: cancel wakes a parked coroutine", "[event][sequence][coro]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    auto iterator = sequence(center, "tick").make_iterator().unwrap();

    std::thread canceller([&iterator] {
        std::this_thread::sleep_for(20ms);
        iterator.cancel();
    });

    auto values = sync_wait(collect_ticks(iterator));
    canceller.join();

    REQUIRE(values.empty());
    REQUIRE(center->live_count() == 0);
}

TEST_CASE("NotificationIterator: finished iterator does not remove twice", "[event][sequence]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    {
        auto iterator = sequence(center, "tick").make_iterator().unwrap();
        center->complete_all();
        REQUIRE_FALSE(iterator.wait_next().has_value());
        REQUIRE(iterator.is_finished());
    }
    // The completed observer was already gone: one NotFound removal at the
    // end, none at destruction
    REQUIRE(center->remove_calls == 1);
    REQUIRE(center->live_count() == 0);
}

TEST_CASE("NotificationIterator: reaching the end removes the observer", "[event][sequence]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    auto iterator = sequence(center, "tick").make_iterator().unwrap();

    center->fire(tick(1));
    center->close_all();
    REQUIRE(center->live_count() == 1);

    REQUIRE(tick_value(*iterator.wait_next()) == 1);
    REQUIRE(center->remove_calls == 0);

    REQUIRE_FALSE(iterator.wait_next().has_value());
    REQUIRE(iterator.is_finished());
    REQUIRE_FALSE(iterator.is_subscribed());

    // Removed by the iterator itself, while it is still alive
    REQUIRE(center->live_count() == 0);
    REQUIRE(center->remove_calls == 1);
    REQUIRE(center->fire(tick(9)) == 0);
}

TEST_CASE("NotificationIterator: cancel races the end of the sequence", "[event][sequence]") {
    for (int round = 0; round < 50; ++round) {
        auto center = std::make_shared<FakeNotificationCenter>();
        auto iterator = sequence(center, "tick").make_iterator().unwrap();
        std::atomic<bool> pulling{false};

        std::thread canceller([&] {
            wait_until([&] { return pulling.load(); });
            iterator.cancel();
        });

        std::size_t received = 0;
        center->fire(tick(1));
        while (!iterator.is_finished()) {
            pulling = true;
            if (iterator.wait_next_for(1ms)) {
                ++received;
            }
        }
        canceller.join();

        REQUIRE(received == 1);
        REQUIRE_FALSE(iterator.is_subscribed());
        REQUIRE(center->live_count() == 0);
        REQUIRE(center->remove_calls == 1);
    }
}

TEST_CASE("NotificationIterator: move keeps one registration", "[event][sequence]") {
    auto center = std::make_shared<FakeNotificationCenter>();
    auto first = sequence(center, "tick").make_iterator().unwrap();

    NotificationIterator second = std::move(first);
    REQUIRE(center->live_count() == 1);
    REQUIRE(second.is_subscribed());

    center->fire(tick(3));
    REQUIRE(tick_value(*second.wait_next()) == 3);

    auto third = sequence(center, "tick").make_iterator().unwrap();
    REQUIRE(center->live_count() == 2);
    third = std::move(second);
    REQUIRE(center->live_count() == 1);
}

// =============================================================================
// With a real center
// =============================================================================

TEST_CASE("NotificationIterator: center shutdown ends the sequence", "[event][sequence]") {
    auto center = NotificationCenter::create();
    auto iterator = sequence(center, "tick").make_iterator().unwrap();

    center->post("tick", std::nullopt, UserInfo{{"n", std::int64_t(1)}});
    center->post("tick", std::nullopt, UserInfo{{"n", std::int64_t(2)}});
    center->shutdown();

    std::vector<std::int64_t> values;
    while (auto notification = iterator.wait_next()) {
        values.push_back(tick_value(*notification));
        REQUIRE(notification->sequence_number() != 0);
    }

    REQUIRE(values == std::vector<std::int64_t>{1, 2});
    REQUIRE(iterator.is_finished());
}

TEST_CASE("NotificationIterator: outlives its center", "[event][sequence]") {
    std::optional<NotificationIterator> iterator;
    {
        auto center = NotificationCenter::create();
        iterator.emplace(sequence(center, "tick").make_iterator().unwrap());
        center->post("tick", std::nullopt, UserInfo{{"n", std::int64_t(9)}});
    }

    REQUIRE(tick_value(*iterator->wait_next()) == 9);
    REQUIRE_FALSE(iterator->wait_next().has_value());
    iterator.reset();
}

TEST_CASE("NotificationIterator: producers on many threads", "[event][sequence][coro]") {
    auto center = NotificationCenter::create();
    auto iterator = sequence(center, "tick").make_iterator().unwrap();

    constexpr int threads = 4;
    constexpr int per_thread = 100;

    std::vector<std::thread> producers;
    for (int t = 0; t < threads; ++t) {
        producers.emplace_back([center, t] {
            for (int i = 0; i < per_thread; ++i) {
                center->post("tick", std::nullopt, UserInfo{{"n", std::int64_t(t * per_thread + i)}});
            }
        });
    }

    std::thread closer([&producers, center] {
        for (auto& p : producers) {
            p.join();
        }
        center->shutdown();
    });

    auto values = sync_wait(collect_ticks(iterator));
    closer.join();

    REQUIRE(values.size() == static_cast<std::size_t>(threads * per_thread));

    // Each producer's notifications arrive in the order it posted them
    std::vector<std::int64_t> last(threads, -1);
    for (auto value : values) {
        auto t = value / per_thread;
        REQUIRE(value > last[t]);
        last[t] = value;
    }
}
