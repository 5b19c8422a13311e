/// @file main.cpp
/// @brief Tick monitor demo
///
/// Posts "tick" notifications from a worker thread and consumes them as an
/// asynchronous sequence from a coroutine. Shutting the center down ends the
/// sequence.
///
/// Options (also readable from BEACON_* environment variables):
///   --log-level=debug
///   --ticks=10
///   --interval_ms=50

#include <beacon/core/core.hpp>
#include <beacon/event/event.hpp>
#include <beacon/stream/stream.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <thread>

namespace {

struct Summary {
    std::size_t received = 0;
    std::int64_t last = 0;
};

beacon_stream::Task<Summary> monitor(beacon_event::NotificationIterator& ticks) {
    Summary summary;
    while (auto tick = co_await ticks.next()) {
        const auto* n = tick->get<std::int64_t>("n");
        spdlog::info("tick #{} n={}", tick->sequence_number(), n ? *n : -1);
        ++summary.received;
        summary.last = n ? *n : summary.last;
    }
    co_return summary;
}

} // namespace

int main(int argc, char** argv) {
    beacon_core::ConfigManager config;
    config.setup_defaults();
    config.load_environment();
    if (auto parsed = config.parse_args(argc, argv); parsed.is_err()) {
        spdlog::error("{}", beacon_core::build_error_chain(parsed.error()));
        return 1;
    }

    beacon_core::configure_logging(beacon_core::LogConfig::from_config(config));

    const auto tick_count = config.get_int("ticks", 10);
    const auto interval = std::chrono::milliseconds(config.get_int("interval_ms", 50));

    auto center = beacon_event::NotificationCenter::create(beacon_event::CenterConfig::from_config(config));

    auto iterator = beacon_event::sequence(center, "tick").make_iterator();
    if (iterator.is_err()) {
        spdlog::error("Cannot observe ticks: {}", beacon_core::build_error_chain(iterator.error()));
        return 1;
    }

    std::thread producer([center, tick_count, interval] {
        for (std::int64_t n = 1; n <= tick_count; ++n) {
            center->post("tick", std::nullopt, beacon_event::UserInfo{{"n", n}});
            std::this_thread::sleep_for(interval);
        }
        center->shutdown();
    });

    auto summary = beacon_stream::sync_wait(monitor(*iterator));
    producer.join();

    auto stats = center->stats();
    spdlog::info("received {} tick(s), last n={}", summary.received, summary.last);
    spdlog::info("center '{}': posted={} delivered={} completed={}",
        center->config().name, stats.posted, stats.delivered, stats.completed);

    beacon_core::shutdown_logging();
    return 0;
}
