#pragma once

/// @file config.hpp
/// @brief JSON-backed tuning parameters for planar_collision
///
/// Example file:
/// @code
/// {
///     "epa_epsilon": 0.0001,
///     "epa_max_iterations": 32,
///     "cell_size": 32.0,
///     "log_level": "info"
/// }
/// @endcode
/// Absent keys keep their defaults.

#include "fwd.hpp"
#include "types.hpp"
#include "spatial_hash.hpp"

#include <planar/core/error.hpp>

#include <functional>
#include <string>

namespace planar_collision {

/// Collision tuning parameters
struct CollisionConfig {
    double epa_epsilon = 1.0e-4;     ///< EPA convergence tolerance
    int epa_max_iterations = k_max_epa_iterations;
    double cell_size = 32.0;         ///< Spatial hash cell edge length
    std::string log_level = "info";  ///< spdlog level name
};

/// Load and validate a config file
[[nodiscard]] planar_core::Result<CollisionConfig> load_collision_config(const std::string& path);

/// Parse and validate JSON text
/// @param source Name used in error messages
[[nodiscard]] planar_core::Result<CollisionConfig> parse_collision_config(const std::string& json_text,
                                                                          const std::string& source = "<memory>");

/// Write a config file (pretty-printed JSON)
[[nodiscard]] planar_core::Result<void> save_collision_config(const CollisionConfig& config,
                                                              const std::string& path);

/// Set the global spdlog level from config.log_level
[[nodiscard]] planar_core::Result<void> apply_logging(const CollisionConfig& config);

/// EPA parameters in the scalar type T
template<typename T>
[[nodiscard]] EpaSettings<T> make_epa_settings(const CollisionConfig& config) {
    return EpaSettings<T>{ScalarTraits<T>::from_double(config.epa_epsilon), config.epa_max_iterations};
}

/// Empty broad phase with the configured cell size
/// @throws std::invalid_argument if config.cell_size is not positive
template<typename Id, typename T, typename Hash = std::hash<Id>>
[[nodiscard]] SpatialHash2D<Id, T, Hash> make_spatial_hash(const CollisionConfig& config) {
    return SpatialHash2D<Id, T, Hash>(ScalarTraits<T>::from_double(config.cell_size));
}

} // namespace planar_collision
