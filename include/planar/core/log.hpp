#pragma once

/// @file log.hpp
/// @brief spdlog-backed logging shared by every planar module
///
/// planar owns a small set of named loggers ("planar_core", "planar_collision",
/// plus any a caller asks for). They all write through one sink list that
/// configure_logging() rebuilds, so switching the console off or adding a
/// log file applies to loggers that already exist.

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

/// Log through the planar core logger
#define PLANAR_LOG_TRACE(...) ::planar_core::core_logger()->trace(__VA_ARGS__)
#define PLANAR_LOG_DEBUG(...) ::planar_core::core_logger()->debug(__VA_ARGS__)
#define PLANAR_LOG_INFO(...) ::planar_core::core_logger()->info(__VA_ARGS__)
#define PLANAR_LOG_WARN(...) ::planar_core::core_logger()->warn(__VA_ARGS__)
#define PLANAR_LOG_ERROR(...) ::planar_core::core_logger()->error(__VA_ARGS__)
#define PLANAR_LOG_CRITICAL(...) ::planar_core::core_logger()->critical(__VA_ARGS__)

namespace planar_core {

// =============================================================================
// Configuration
// =============================================================================

/// Sinks and level shared by the planar loggers
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;

    /// Colour output on stdout
    bool console = true;

    /// Rotating log file; no file sink when empty
    std::string file_path;
    std::size_t file_max_bytes = 1024 * 1024;
    std::size_t file_max_count = 2;

    std::string pattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
};

/// Rebuild the shared sinks and apply the level to every planar logger.
/// A log file that cannot be opened is reported on the remaining sinks.
void configure_logging(const LogConfig& config);

// =============================================================================
// Loggers
// =============================================================================

/// Named logger writing through the shared sinks, created on first use
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// "planar_core", used by the PLANAR_LOG_* macros
std::shared_ptr<spdlog::logger> core_logger();

/// "planar_collision": narrow phase and spatial hash diagnostics
std::shared_ptr<spdlog::logger> collision_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

/// No effect if no planar logger carries that name
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Lower-case spdlog names plus the aliases "warning", "err" and "fatal"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Canonical name accepted by parse_log_level()
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Unregister the planar loggers and shut spdlog down
void shutdown_logging();

} // namespace planar_core
