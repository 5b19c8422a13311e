#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for beacon_core module

#include <cstdint>

namespace beacon_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct SubscriptionError;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Configuration
// =============================================================================

enum class ConfigLayerPriority : std::int32_t;
class ConfigLayer;
class ConfigManager;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace beacon_core
