#pragma once
#include <stlcheck/utility.hpp>

namespace stlcheck {

struct stl_binary_format {
  using header = array<uint8, 80>;
  using size_type = uint32;
  using attribute_byte_count_type = uint16;

  struct alignas(1) triangle {
    vec3 normal;
    vec3 vertex[3];
  };

  // On disk, every triangle is followed by its attribute byte count
  // and no padding is inserted between records.
  struct record {
    triangle data;
    attribute_byte_count_type attribute_byte_count;
  };

  static constexpr size_t header_size = sizeof(header);
  static constexpr size_t size_field_size = sizeof(size_type);
  static constexpr size_t triangle_size = 12 * sizeof(float32);
  static constexpr size_t record_size =
      triangle_size + sizeof(attribute_byte_count_type);
  static constexpr size_t data_offset = header_size + size_field_size;

  using record_bytes = array<uint8, record_size>;

  /// Returns the byte offset of the record with the given index.
  static constexpr auto offset(uint64 index) noexcept -> uint64 {
    return data_offset + index * record_size;
  }

  /// Returns the file size a binary STL file
  /// with the given amount of triangles must have.
  static constexpr auto file_size(uint64 triangles) noexcept -> uint64 {
    return offset(triangles);
  }

  static auto decode(const record_bytes& bytes) noexcept -> record;
};

}  // namespace stlcheck
