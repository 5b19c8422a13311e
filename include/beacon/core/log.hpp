#pragma once

/// @file log.hpp
/// @brief spdlog loggers for the beacon subsystems
///
/// Each module logs through its own named logger (`beacon_core`,
/// `beacon_stream`, `beacon_event`). Sinks and the level come from a
/// LogConfig, normally built from the `log.*` configuration keys.

#include "fwd.hpp"
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace beacon_core {

// =============================================================================
// Configuration
// =============================================================================

/// Sinks and level applied to every subsystem logger
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;

    /// Read `log.level`, `log.console`, `log.file`, `log.directory`,
    /// `log.max_file_size` and `log.max_files`. Missing keys and unknown
    /// level names keep the defaults above.
    [[nodiscard]] static LogConfig from_config(const ConfigManager& config);
};

/// Apply a configuration. Loggers created later get the new sinks;
/// existing ones only take the new level.
void configure_logging(const LogConfig& config);

// =============================================================================
// Loggers
// =============================================================================

/// Logger for `name`, created with the configured sinks on first use
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Configuration layer
std::shared_ptr<spdlog::logger> core_logger();

/// AsyncBuffer and run loop
std::shared_ptr<spdlog::logger> stream_logger();

/// Notification center and sequence adapter
std::shared_ptr<spdlog::logger> event_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);
void set_logger_level(const std::string& name, spdlog::level::level_enum level);
[[nodiscard]] spdlog::level::level_enum get_global_log_level();

/// "trace", "debug", "info", "warn"/"warning", "error"/"err",
/// "critical"/"fatal", "off"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

/// Flush and drop every beacon logger
void shutdown_logging();

} // namespace beacon_core
