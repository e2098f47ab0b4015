#pragma once
#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
//
#include <glm/glm.hpp>

namespace stlcheck {

using namespace std;
using namespace glm;

using uint8 = uint8_t;
using uint16 = uint16_t;
using uint32 = uint32_t;
using uint64 = uint64_t;
using float32 = float;
using real = float32;
using czstring = const char*;

// Binary STL data is stored in little-endian byte order.
template <typename type>
  requires is_trivially_copyable_v<type>
inline auto load_little_endian(const uint8* data) noexcept -> type {
  array<uint8, sizeof(type)> bytes{};
  std::memcpy(bytes.data(), data, sizeof(type));
  if constexpr (endian::native == endian::big) ranges::reverse(bytes);
  return bit_cast<type>(bytes);
}

}  // namespace stlcheck
