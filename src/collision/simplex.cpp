/// @file simplex.cpp
/// @brief Explicit instantiations of Simplex2D

#include <planar/collision/simplex.hpp>

namespace planar_collision {

template class Simplex2D<float>;
template class Simplex2D<Fix64>;

} // namespace planar_collision
