/// @file config.cpp
/// @brief Layered configuration implementation for beacon_core

#include <beacon/core/config.hpp>
#include <beacon/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace beacon_core {

// =============================================================================
// Value Parsing
// =============================================================================

ConfigValue parse_config_value(const std::string& raw) {
    if (raw == "true" || raw == "false") {
        return ConfigValue{raw == "true"};
    }

    std::int64_t int_val = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [int_end, int_ec] = std::from_chars(first, last, int_val);
    if (!raw.empty() && int_ec == std::errc{} && int_end == last) {
        return ConfigValue{int_val};
    }

    if (!raw.empty()) {
        char* float_end = nullptr;
        double float_val = std::strtod(raw.c_str(), &float_end);
        if (float_end == raw.c_str() + raw.size()) {
            return ConfigValue{float_val};
        }
    }

    return ConfigValue{raw};
}

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

void ConfigLayer::clear() {
    m_values.clear();
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigManager
// =============================================================================

void ConfigManager::add_layer(std::unique_ptr<ConfigLayer> layer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_layers.push_back(std::move(layer));
}

ConfigLayer* ConfigManager::get_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

bool ConfigManager::remove_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::remove_if(m_layers.begin(), m_layers.end(),
        [&name](const std::unique_ptr<ConfigLayer>& layer) {
            return layer->name() == name;
        });
    if (it != m_layers.end()) {
        m_layers.erase(it, m_layers.end());
        return true;
    }
    return false;
}

std::size_t ConfigManager::layer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_layers.size();
}

void ConfigManager::create_default_layers() {
    std::lock_guard<std::mutex> lock(m_mutex);
    find_or_create_layer("runtime", ConfigLayerPriority::Runtime);
    find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);
    find_or_create_layer("environment", ConfigLayerPriority::Environment);
    find_or_create_layer("defaults", ConfigLayerPriority::Default);
}

void ConfigManager::setup_defaults() {
    create_default_layers();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto* defaults = find_or_create_layer("defaults", ConfigLayerPriority::Default);

    defaults->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
    defaults->set(config_keys::LOG_CONSOLE, ConfigValue{true});
    defaults->set(config_keys::LOG_FILE, ConfigValue{false});
    defaults->set(config_keys::LOG_DIRECTORY, ConfigValue{std::string("logs")});
    defaults->set(config_keys::LOG_MAX_FILE_SIZE, ConfigValue{std::int64_t(10 * 1024 * 1024)});
    defaults->set(config_keys::LOG_MAX_FILES, ConfigValue{std::int64_t(5)});

    defaults->set(config_keys::CENTER_NAME, ConfigValue{std::string("default")});
    defaults->set(config_keys::CENTER_MAX_OBSERVERS, ConfigValue{std::int64_t(0)});
    defaults->set(config_keys::CENTER_LOG_POSTS, ConfigValue{false});
}

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        if (*v == "true" || *v == "1" || *v == "yes") return true;
        if (*v == "false" || *v == "0" || *v == "no") return false;
        return default_value;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        auto parsed = parse_config_value(*v);
        if (auto* i = std::get_if<std::int64_t>(&parsed)) {
            return *i;
        }
        return default_value;
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }

    return default_value;
}

double ConfigManager::get_float(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<double>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return static_cast<double>(*v);
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        auto parsed = parse_config_value(*v);
        if (auto* d = std::get_if<double>(&parsed)) {
            return *d;
        }
        if (auto* i = std::get_if<std::int64_t>(&parsed)) {
            return static_cast<double>(*i);
        }
        return default_value;
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? "true" : "false";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return std::to_string(*v);
    }

    return default_value;
}

std::vector<std::string> ConfigManager::get_string_array(
    const std::string& key,
    const std::vector<std::string>& default_value) const
{
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::vector<std::string>>(&*value)) {
        return *v;
    }

    return default_value;
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    std::vector<std::function<void(const std::string&, const ConfigValue&)>> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto* layer = find_or_create_layer(layer_name, ConfigLayerPriority::Runtime);
        layer->set(key, value);
        callbacks = m_change_callbacks;
    }

    for (const auto& callback : callbacks) {
        callback(key, value);
    }
}

void ConfigManager::set_bool(const std::string& key, bool value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_int(const std::string& key, std::int64_t value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_string(const std::string& key, const std::string& value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::on_change(std::function<void(const std::string& key, const ConfigValue& value)> callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_change_callbacks.push_back(std::move(callback));
}

Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto* layer = find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (!arg.starts_with("--")) {
            continue;  // Positional arguments belong to the application
        }

        std::string key_value = arg.substr(2);
        auto eq_pos = key_value.find('=');

        std::string key;
        std::string value;

        if (eq_pos != std::string::npos) {
            key = key_value.substr(0, eq_pos);
            value = key_value.substr(eq_pos + 1);
        } else if (i + 1 < args.size() && !args[i + 1].starts_with("--")) {
            key = key_value;
            value = args[++i];
        } else {
            key = key_value;
            value = "true";
        }

        if (key.empty()) {
            core_logger()->warn("rejected command line option '{}'", arg);
            return Error{ConfigError::parse_failed(arg, "empty option name")};
        }

        std::replace(key.begin(), key.end(), '-', '.');
        layer->set(key, parse_config_value(value));
    }

    return Ok();
}

void ConfigManager::load_environment(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto* layer = find_or_create_layer("environment", ConfigLayerPriority::Environment);

    for (const auto& key : config_keys::all()) {
        std::string env_name = prefix;
        for (char c : key) {
            env_name.push_back(c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }

        if (const char* value = std::getenv(env_name.c_str())) {
            core_logger()->debug("config '{}' set from {}", key, env_name);
            layer->set(key, parse_config_value(value));
        }
    }
}

std::vector<const ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<const ConfigLayer*> result;
    result.reserve(m_layers.size());
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    // Lower value = higher priority; stable keeps insertion order among equals
    std::stable_sort(result.begin(), result.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<int>(a->priority()) < static_cast<int>(b->priority());
        });

    return result;
}

ConfigLayer* ConfigManager::find_or_create_layer(const std::string& name, ConfigLayerPriority priority) {
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return m_layers.back().get();
}

} // namespace beacon_core
