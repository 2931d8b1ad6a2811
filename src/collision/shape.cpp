/// @file shape.cpp
/// @brief Explicit instantiations of the planar_collision shapes

#include <planar/collision/aabb.hpp>
#include <planar/collision/shape.hpp>

namespace planar_collision {

template struct AABB2D<float>;
template struct AABB2D<Fix64>;

template class Point<float>;
template class Point<Fix64>;
template class Circle<float>;
template class Circle<Fix64>;
template class Rectangle<float>;
template class Rectangle<Fix64>;
template class Line<float>;
template class Line<Fix64>;
template class Shape<float>;
template class Shape<Fix64>;

} // namespace planar_collision
