/// @file transform.cpp
/// @brief Transform2D explicit instantiations for the supported scalars

#include <planar/math/transform.hpp>

namespace planar_math {

template class Transform2D<float>;
template class Transform2D<Fix64>;

} // namespace planar_math
