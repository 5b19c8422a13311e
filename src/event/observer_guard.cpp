/// @file observer_guard.cpp
/// @brief ObserverGuard removal path

#include <beacon/event/observer_guard.hpp>
#include <beacon/core/log.hpp>

#include <exception>

namespace beacon_event {

void ObserverGuard::reset() noexcept {
    ObserverToken token{m_token_id.exchange(0)};
    if (!token.is_valid()) {
        return;
    }

    auto center = m_center.lock();
    if (!center) {
        return;
    }

    try {
        auto result = center->remove_observer(token);
        if (result.is_ok()) {
            return;
        }
        // The center already completed this observer (shutdown, retired source)
        if (result.error().code() == beacon_core::ErrorCode::NotFound) {
            beacon_core::event_logger()->trace("observer {} already gone", token.id);
        } else {
            beacon_core::event_logger()->warn("removing observer {} failed: {}",
                token.id, beacon_core::build_error_chain(result.error()));
        }
    } catch (const std::exception& ex) {
        beacon_core::event_logger()->warn("removing observer {} threw: {}", token.id, ex.what());
    }
}

} // namespace beacon_event
