#pragma once
#include <stlcheck/diagnostics.hpp>
#include <stlcheck/math.hpp>
#include <stlcheck/stl_binary_format.hpp>

namespace stlcheck {

/// Streams the triangle records of a binary STL file
/// and checks every one of them without storing the mesh.
///
class stl_binary_validator {
 public:
  explicit stl_binary_validator(diagnostics& log) noexcept : log{log} {}

  auto validate(istream& input) -> status;

  auto triangle_count() const noexcept { return triangles; }

 private:
  auto check(const stl_binary_format::record& r, uint64 offset) -> status;

  diagnostics& log;
  stl_binary_format::size_type triangles = 0;
};

}  // namespace stlcheck
