/// @file log.cpp
/// @brief Subsystem logger registry

#include <beacon/core/log.hpp>
#include <beacon/core/config.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace beacon_core {

namespace {

constexpr const char* kConsolePattern = "[%H:%M:%S.%e] [%^%l%$] [%n] [t:%t] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [t:%t] %v";

class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    void configure(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(config.level);
        }
        spdlog::set_level(config.level);
    }

    std::shared_ptr<spdlog::logger> logger(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            return it->second;
        }

        auto sinks = make_sinks(name);
        auto created = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        created->set_level(m_config.level);
        m_loggers.emplace(name, created);

        // Someone may have registered the name with spdlog directly
        if (!spdlog::get(name)) {
            spdlog::register_logger(created);
        }
        return created;
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.level = level;
        for (auto& [name, logger] : m_loggers) {
            logger->set_level(level);
        }
        spdlog::set_level(level);
    }

    void set_level(const std::string& name, spdlog::level::level_enum level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            it->second->set_level(level);
        }
    }

    spdlog::level::level_enum level() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config.level;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            spdlog::drop(name);
        }
        m_loggers.clear();
    }

private:
    std::vector<spdlog::sink_ptr> make_sinks(const std::string& name) const {
        std::vector<spdlog::sink_ptr> sinks;

        if (m_config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_pattern(kConsolePattern);
            sinks.push_back(std::move(console));
        }

        if (m_config.file_enabled && !m_config.log_directory.empty()) {
            auto path = std::filesystem::path(m_config.log_directory) / (name + ".log");
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), m_config.max_file_size, m_config.max_files);
                file->set_pattern(kFilePattern);
                sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& ex) {
                spdlog::warn("'{}' logs to console only, cannot open {}: {}", name, path.string(), ex.what());
            }
        }

        return sinks;
    }

    std::mutex m_mutex;
    LogConfig m_config;
    std::map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
};

} // namespace

// =============================================================================
// Configuration
// =============================================================================

LogConfig LogConfig::from_config(const ConfigManager& config) {
    LogConfig result;

    auto level_name = config.get_string(config_keys::LOG_LEVEL, log_level_name(result.level));
    if (auto level = parse_log_level(level_name)) {
        result.level = *level;
    }

    result.console_enabled = config.get_bool(config_keys::LOG_CONSOLE, result.console_enabled);
    result.file_enabled = config.get_bool(config_keys::LOG_FILE, result.file_enabled);
    result.log_directory = config.get_string(config_keys::LOG_DIRECTORY, result.log_directory);

    auto max_file_size = config.get_int(config_keys::LOG_MAX_FILE_SIZE, 0);
    if (max_file_size > 0) {
        result.max_file_size = static_cast<std::size_t>(max_file_size);
    }
    auto max_files = config.get_int(config_keys::LOG_MAX_FILES, 0);
    if (max_files > 0) {
        result.max_files = static_cast<std::size_t>(max_files);
    }

    return result;
}

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().configure(config);
}

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LoggerRegistry::instance().logger(name);
}

std::shared_ptr<spdlog::logger> core_logger() {
    static auto logger = get_logger("beacon_core");
    return logger;
}

std::shared_ptr<spdlog::logger> stream_logger() {
    static auto logger = get_logger("beacon_stream");
    return logger;
}

std::shared_ptr<spdlog::logger> event_logger() {
    static auto logger = get_logger("beacon_event");
    return logger;
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(level);
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(name, level);
}

spdlog::level::level_enum get_global_log_level() {
    return LoggerRegistry::instance().level();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    static const std::map<std::string, spdlog::level::level_enum> levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"fatal", spdlog::level::critical},
        {"off", spdlog::level::off},
    };

    if (auto it = levels.find(name); it != levels.end()) {
        return it->second;
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

void shutdown_logging() {
    LoggerRegistry::instance().shutdown();
    spdlog::shutdown();
}

} // namespace beacon_core
