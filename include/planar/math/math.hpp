#pragma once

/// @file math.hpp
/// @brief Main include header for planar_math
///
/// Scalars (float, Fix64), 2D vectors and 3x2 affine matrices over GLM,
/// and Transform2D.

#include "fwd.hpp"
#include "constants.hpp"
#include "fixed.hpp"
#include "scalar.hpp"
#include "types.hpp"
#include "vec.hpp"
#include "mat.hpp"
#include "transform.hpp"

/// Convenience namespace alias
namespace pmath = planar_math;
