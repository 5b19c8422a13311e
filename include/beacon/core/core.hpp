#pragma once

/// @file core.hpp
/// @brief Main include file for beacon_core module
///
/// This header includes all beacon_core components in dependency order.

#include "fwd.hpp"
#include "error.hpp"
#include "config.hpp"
#include "log.hpp"

/// @namespace beacon_core
/// @brief Shared infrastructure for the beacon modules
///
/// - **Error Handling**: Result<T> with typed error kinds
/// - **Configuration**: layered defaults / environment / command line
/// - **Logging**: spdlog named loggers per module
///
/// Example usage:
/// @code
/// #include <beacon/core/core.hpp>
///
/// beacon_core::ConfigManager config;
/// config.setup_defaults();
/// config.load_environment();
/// config.parse_args(argc, argv);
/// beacon_core::configure_logging(beacon_core::LogConfig::from_config(config));
/// @endcode
