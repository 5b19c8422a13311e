/// @file config.hpp
/// @brief Layered configuration for beacon
///
/// Provides layered configuration with:
/// - Built-in default values
/// - Environment variable overrides
/// - Command-line argument parsing
/// - Runtime modification

#pragma once

#include "fwd.hpp"
#include "error.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace beacon_core {

// =============================================================================
// Config Value
// =============================================================================

/// A configuration value
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    Runtime = -2000,        ///< Values set programmatically (highest)
    CommandLine = -1000,    ///< Command-line arguments
    Environment = -500,     ///< Environment variables
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::Runtime)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);
    bool remove(const std::string& key);
    void clear();

    /// Get all keys
    [[nodiscard]] std::vector<std::string> keys() const;

    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
///
/// Lookups walk the layers from highest to lowest priority and return the
/// first value found. Typed getters convert between compatible value kinds
/// (string "true"/"1"/"yes" to bool, numeric strings to numbers) and fall
/// back to the supplied default otherwise.
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    void add_layer(std::unique_ptr<ConfigLayer> layer);

    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;

    bool remove_layer(const std::string& name);

    [[nodiscard]] std::size_t layer_count() const;

    /// Create the standard layers (defaults, environment, cmdline, runtime)
    void create_default_layers();

    /// Create the standard layers and fill `defaults` with built-in values
    void setup_defaults();

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;
    [[nodiscard]] std::vector<std::string> get_string_array(
        const std::string& key,
        const std::vector<std::string>& default_value = {}) const;

    // =========================================================================
    // Value Setting
    // =========================================================================

    /// Set value in a layer, creating it (runtime priority) if missing
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "runtime");

    void set_bool(const std::string& key, bool value, const std::string& layer_name = "runtime");
    void set_int(const std::string& key, std::int64_t value, const std::string& layer_name = "runtime");
    void set_string(const std::string& key, const std::string& value, const std::string& layer_name = "runtime");

    /// Called after every set() with the key and new value
    void on_change(std::function<void(const std::string& key, const ConfigValue& value)> callback);

    // =========================================================================
    // Command Line
    // =========================================================================

    /// Parse `--key=value`, `--key value` and `--flag` arguments into the
    /// `cmdline` layer. Dashes in keys become dots (`--log-level` -> `log.level`).
    Result<void> parse_args(int argc, char** argv);
    Result<void> parse_args(const std::vector<std::string>& args);

    // =========================================================================
    // Environment
    // =========================================================================

    /// Load every known key from `<prefix><KEY>` environment variables,
    /// where KEY is the upper-cased key with dots replaced by underscores
    /// (`log.level` -> `BEACON_LOG_LEVEL`).
    void load_environment(const std::string& prefix = "BEACON_");

private:
    [[nodiscard]] std::vector<const ConfigLayer*> sorted_layers() const;
    ConfigLayer* find_or_create_layer(const std::string& name, ConfigLayerPriority priority);

    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    mutable std::mutex m_mutex;
    std::vector<std::function<void(const std::string&, const ConfigValue&)>> m_change_callbacks;
};

/// Parse a raw string into the most specific ConfigValue (bool, int, float, string)
[[nodiscard]] ConfigValue parse_config_value(const std::string& raw);

// =============================================================================
// Config Keys (Constants)
// =============================================================================

namespace config_keys {

// Logging
constexpr const char* LOG_LEVEL = "log.level";
constexpr const char* LOG_CONSOLE = "log.console";
constexpr const char* LOG_FILE = "log.file";
constexpr const char* LOG_DIRECTORY = "log.directory";
constexpr const char* LOG_MAX_FILE_SIZE = "log.max_file_size";
constexpr const char* LOG_MAX_FILES = "log.max_files";

// Notification center
constexpr const char* CENTER_NAME = "center.name";
constexpr const char* CENTER_MAX_OBSERVERS = "center.max_observers";
constexpr const char* CENTER_LOG_POSTS = "center.log_posts";

/// Every key above, for environment lookup
inline const std::vector<std::string>& all() {
    static const std::vector<std::string> keys = {
        LOG_LEVEL, LOG_CONSOLE, LOG_FILE, LOG_DIRECTORY, LOG_MAX_FILE_SIZE, LOG_MAX_FILES,
        CENTER_NAME, CENTER_MAX_OBSERVERS, CENTER_LOG_POSTS,
    };
    return keys;
}

} // namespace config_keys

} // namespace beacon_core
