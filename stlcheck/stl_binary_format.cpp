#include <stlcheck/stl_binary_format.hpp>

namespace stlcheck {

auto stl_binary_format::decode(const record_bytes& bytes) noexcept -> record {
  static_assert(record_size == 50);
  static_assert(data_offset == 84);

  // Due to padding and alignment issues concerning 'float32' and 'uint16',
  // we cannot copy the whole record at once.
  // Instead, every component is decoded on its own.
  const auto component = [&](size_t index) {
    return load_little_endian<float32>(&bytes[index * sizeof(float32)]);
  };
  const auto vector_at = [&](size_t index) {
    return vec3{component(3 * index), component(3 * index + 1),
                component(3 * index + 2)};
  };

  record result{};
  result.data.normal = vector_at(0);
  for (size_t i = 0; i < 3; ++i) result.data.vertex[i] = vector_at(i + 1);
  result.attribute_byte_count =
      load_little_endian<attribute_byte_count_type>(&bytes[triangle_size]);
  return result;
}

}  // namespace stlcheck
