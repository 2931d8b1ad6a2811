/// @file config.cpp
/// @brief CollisionConfig loading and validation

#include <planar/collision/config.hpp>
#include <planar/core/log.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace planar_collision {

using planar_core::ConfigError;
using planar_core::Err;
using planar_core::Ok;
using planar_core::Result;

namespace {

Result<void> read_number(const nlohmann::json& j, const char* key, const std::string& source, double& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j[key];
    if (!value.is_number()) {
        return Err(ConfigError::invalid_value(source, key, "expected a number"));
    }
    out = value.get<double>();
    return Ok();
}

Result<void> read_integer(const nlohmann::json& j, const char* key, const std::string& source, int& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j[key];
    if (!value.is_number_integer()) {
        return Err(ConfigError::invalid_value(source, key, "expected an integer"));
    }
    out = value.get<int>();
    return Ok();
}

Result<void> read_string(const nlohmann::json& j, const char* key, const std::string& source, std::string& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    const auto& value = j[key];
    if (!value.is_string()) {
        return Err(ConfigError::invalid_value(source, key, "expected a string"));
    }
    out = value.get<std::string>();
    return Ok();
}

Result<void> validate(const CollisionConfig& config, const std::string& source) {
    if (!(config.epa_epsilon > 0.0)) {
        return Err(ConfigError::invalid_value(source, "epa_epsilon", "must be positive"));
    }
    if (config.epa_max_iterations <= 0) {
        return Err(ConfigError::invalid_value(source, "epa_max_iterations", "must be positive"));
    }
    if (!(config.cell_size > 0.0)) {
        return Err(ConfigError::invalid_value(source, "cell_size", "must be positive"));
    }
    if (!planar_core::parse_log_level(config.log_level)) {
        return Err(ConfigError::invalid_value(source, "log_level", "unknown level '" + config.log_level + "'"));
    }
    return Ok();
}

Result<CollisionConfig> from_json(const nlohmann::json& j, const std::string& source) {
    if (!j.is_object()) {
        return Err<CollisionConfig>(ConfigError::parse_failed(source, "expected a JSON object"));
    }

    CollisionConfig config;

    for (auto result : {read_number(j, "epa_epsilon", source, config.epa_epsilon),
                        read_integer(j, "epa_max_iterations", source, config.epa_max_iterations),
                        read_number(j, "cell_size", source, config.cell_size),
                        read_string(j, "log_level", source, config.log_level)}) {
        if (result.is_err()) {
            return Err<CollisionConfig>(result.error());
        }
    }

    auto valid = validate(config, source);
    if (valid.is_err()) {
        return Err<CollisionConfig>(valid.error());
    }
    return Ok(std::move(config));
}

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

Result<CollisionConfig> parse_collision_config(const std::string& json_text, const std::string& source) {
    try {
        const auto j = nlohmann::json::parse(json_text);
        auto result = from_json(j, source);
        if (result.is_err()) {
            PLANAR_LOG_WARN("Rejected collision config: {}", planar_core::build_error_chain(result.error()));
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        PLANAR_LOG_WARN("Failed to parse collision config '{}': {}", source, e.what());
        return Err<CollisionConfig>(ConfigError::parse_failed(source, e.what()));
    }
}

Result<CollisionConfig> load_collision_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        PLANAR_LOG_WARN("Collision config not found: {}", path);
        return Err<CollisionConfig>(ConfigError::file_not_found(path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_collision_config(buffer.str(), path);
}

Result<void> save_collision_config(const CollisionConfig& config, const std::string& path) {
    nlohmann::json j;
    j["epa_epsilon"] = config.epa_epsilon;
    j["epa_max_iterations"] = config.epa_max_iterations;
    j["cell_size"] = config.cell_size;
    j["log_level"] = config.log_level;

    std::ofstream file(path);
    if (!file.is_open()) {
        PLANAR_LOG_WARN("Cannot write collision config: {}", path);
        return Err(planar_core::Error(planar_core::ErrorCode::IOError, "Cannot open for writing: " + path));
    }

    file << j.dump(4);
    return Ok();
}

// =============================================================================
// Application
// =============================================================================

Result<void> apply_logging(const CollisionConfig& config) {
    auto level = planar_core::parse_log_level(config.log_level);
    if (!level) {
        return Err(ConfigError::invalid_value("CollisionConfig", "log_level",
                                              "unknown level '" + config.log_level + "'"));
    }
    planar_core::set_global_log_level(*level);
    return Ok();
}

} // namespace planar_collision
