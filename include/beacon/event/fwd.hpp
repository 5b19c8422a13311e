#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for beacon_event

#include <string>

namespace beacon_event {

using NotificationName = std::string;

// Payload
class SourceRef;
class Notification;

// Broadcast facility
struct ObserverToken;
class INotificationCenter;
class NotificationCenter;
struct CenterStats;

// Subscription lifetime
class ObserverGuard;

// Sequence adapter
class NotificationSequence;
class NotificationIterator;

} // namespace beacon_event
