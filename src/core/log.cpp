/// @file log.cpp
/// @brief Shared sinks and named loggers for planar

#include <planar/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace planar_core {

namespace {

using Level = spdlog::level::level_enum;

/// Canonical names come first so log_level_name() finds them before aliases
constexpr std::array<std::pair<std::string_view, Level>, 10> k_level_names{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
    {"warning", spdlog::level::warn},
    {"err", spdlog::level::err},
    {"fatal", spdlog::level::critical},
}};

/// Process-wide logging state, guarded by its own mutex
class LogState {
public:
    static LogState& get() {
        static LogState state;
        return state;
    }

    /// Returns the path of a log file that could not be opened, empty otherwise
    std::string reconfigure(const LogConfig& config) {
        std::lock_guard lock(m_mutex);
        m_config = config;
        std::string failed_file = rebuild_sinks();

        for (auto& logger : m_loggers) {
            logger->sinks() = m_sinks;
            logger->set_level(m_config.level);
        }
        spdlog::set_level(m_config.level);
        return failed_file;
    }

    std::shared_ptr<spdlog::logger> find_or_create(const std::string& name) {
        std::lock_guard lock(m_mutex);
        for (const auto& logger : m_loggers) {
            if (logger->name() == name) {
                return logger;
            }
        }

        // Someone else may have registered the name with spdlog directly
        auto logger = spdlog::get(name);
        if (!logger) {
            logger = std::make_shared<spdlog::logger>(name, m_sinks.begin(), m_sinks.end());
            spdlog::register_logger(logger);
        }
        logger->set_level(m_config.level);
        m_loggers.push_back(logger);
        return logger;
    }

    void set_level(Level level) {
        std::lock_guard lock(m_mutex);
        m_config.level = level;
        spdlog::set_level(level);
        for (auto& logger : m_loggers) {
            logger->set_level(level);
        }
    }

    void set_level(const std::string& name, Level level) {
        std::lock_guard lock(m_mutex);
        for (auto& logger : m_loggers) {
            if (logger->name() == name) {
                logger->set_level(level);
            }
        }
    }

    Level level() {
        std::lock_guard lock(m_mutex);
        return m_config.level;
    }

    void flush() {
        std::lock_guard lock(m_mutex);
        for (auto& logger : m_loggers) {
            logger->flush();
        }
    }

    void drop_all() {
        std::lock_guard lock(m_mutex);
        for (const auto& logger : m_loggers) {
            spdlog::drop(logger->name());
        }
        m_loggers.clear();
    }

private:
    LogState() { rebuild_sinks(); }

    std::string rebuild_sinks() {
        m_sinks.clear();

        if (m_config.console) {
            m_sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }

        std::string failed_file;
        if (!m_config.file_path.empty()) {
            try {
                m_sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    m_config.file_path, m_config.file_max_bytes, m_config.file_max_count));
            } catch (const spdlog::spdlog_ex&) {
                failed_file = m_config.file_path;
            }
        }

        for (auto& sink : m_sinks) {
            sink->set_pattern(m_config.pattern);
        }
        return failed_file;
    }

    std::mutex m_mutex;
    LogConfig m_config;
    std::vector<spdlog::sink_ptr> m_sinks;
    std::vector<std::shared_ptr<spdlog::logger>> m_loggers;
};

} // namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    const std::string failed_file = LogState::get().reconfigure(config);
    if (!failed_file.empty()) {
        core_logger()->warn("Log file '{}' could not be opened, file logging disabled", failed_file);
    }
}

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return LogState::get().find_or_create(name);
}

std::shared_ptr<spdlog::logger> core_logger() {
    return get_logger("planar_core");
}

std::shared_ptr<spdlog::logger> collision_logger() {
    return get_logger("planar_collision");
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    LogState::get().set_level(level);
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    LogState::get().set_level(name, level);
}

spdlog::level::level_enum get_global_log_level() {
    return LogState::get().level();
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    for (const auto& [name, level] : k_level_names) {
        if (name == str) {
            return level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    for (const auto& [name, value] : k_level_names) {
        if (value == level) {
            return name.data();
        }
    }
    return "unknown";
}

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers() {
    LogState::get().flush();
}

void shutdown_logging() {
    LogState::get().drop_all();
    spdlog::shutdown();
}

} // namespace planar_core
