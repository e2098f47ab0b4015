#pragma once
#include <stlcheck/utility.hpp>

namespace stlcheck {

inline auto dot_product(vec3 a, vec3 b) noexcept -> real { return dot(a, b); }

inline auto cross_product(vec3 a, vec3 b) noexcept -> vec3 {
  return cross(a, b);
}

inline auto magnitude(vec3 v) noexcept -> real { return length(v); }

// The zero vector has no direction and is returned unchanged.
inline auto normalized(vec3 v) noexcept -> vec3 {
  const auto l = magnitude(v);
  if (l == real(0)) return v;
  return v / l;
}

/// Checks whether the vertices of a facet are ordered counterclockwise
/// when looking against the given normal.
/// Degenerate facets, whose edges are collinear, have no orientation
/// and are never counterclockwise.
///
inline bool counterclockwise(vec3 v1, vec3 v2, vec3 v3, vec3 normal) noexcept {
  const auto e1 = v2 - v1;
  const auto e2 = v3 - v1;
  return dot_product(cross_product(e1, e2), normal) > real(0);
}

}  // namespace stlcheck
