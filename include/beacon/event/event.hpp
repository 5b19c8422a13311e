#pragma once

/// @file event.hpp
/// @brief Main include header for beacon_event
///
/// beacon_event provides a broadcast notification facility and the adapter
/// that exposes it as an asynchronous pull sequence:
/// - NotificationCenter: register observers, post named notifications
/// - ObserverGuard: RAII removal of one observer
/// - NotificationSequence / NotificationIterator: `co_await it.next()` loop
///   over the notifications posted after the iterator was created

#include "fwd.hpp"
#include "notification.hpp"
#include "notification_center.hpp"
#include "observer_guard.hpp"
#include "notification_sequence.hpp"
