#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for planar_core module

#include <cstdint>

namespace planar_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ConfigError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

} // namespace planar_core
