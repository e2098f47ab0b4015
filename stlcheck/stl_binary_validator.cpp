#include <stlcheck/stl_binary_validator.hpp>

namespace stlcheck {

namespace {

inline bool read_bytes(istream& input, uint8* data, size_t size) {
  return bool(input.read(reinterpret_cast<char*>(data), size));
}

}  // namespace

auto stl_binary_validator::validate(istream& input) -> status {
  triangles = 0;

  // We will ignore the header.
  // It has no specific use to us.
  stl_binary_format::header header{};
  if (!read_bytes(input, header.data(), header.size()))
    return log.report(violation::unexpected_end_of_input,
                      location::byte_offset(0),
                      "unexpected end of input, expected 80-byte header");

  array<uint8, stl_binary_format::size_field_size> size{};
  if (!read_bytes(input, size.data(), size.size()))
    return log.report(violation::unexpected_end_of_input,
                      location::byte_offset(stl_binary_format::header_size),
                      "unexpected end of input, expected triangle count");
  triangles = load_little_endian<stl_binary_format::size_type>(size.data());

  stl_binary_format::record_bytes bytes{};
  for (uint64 i = 0; i < triangles; ++i) {
    const auto offset = stl_binary_format::offset(i);
    if (!read_bytes(input, bytes.data(), bytes.size()))
      return log.report(violation::unexpected_end_of_input,
                        location::byte_offset(offset),
                        "unexpected end of input, expected triangle record " +
                            std::to_string(i + 1) + " of " +
                            std::to_string(triangles));
    if (auto s = check(stl_binary_format::decode(bytes), offset); !s) return s;
  }
  return {};
}

auto stl_binary_validator::check(const stl_binary_format::record& r,
                                 uint64 offset) -> status {
  const auto where = location::byte_offset(offset);
  const auto& [normal, vertex] = r.data;

  bool negative = false;
  for (const auto& v : vertex)
    negative = negative || v.x < 0 || v.y < 0 || v.z < 0;
  if (negative)
    if (auto s = log.report(violation::negative_vertex, where,
                            "not all vertices of this facet have positive "
                            "values");
        !s)
      return s;

  if (!counterclockwise(vertex[0], vertex[1], vertex[2], normal))
    if (auto s = log.report(violation::winding_order, where,
                            "vertices of this facet are not ordered "
                            "counterclockwise");
        !s)
      return s;

  const auto has_nan = [](vec3 v) {
    return std::isnan(v.x) || std::isnan(v.y) || std::isnan(v.z);
  };
  if (has_nan(normal) || ranges::any_of(vertex, has_nan))
    return log.report(violation::not_a_number, where,
                      "file contains NaN values in normal or vertex "
                      "coordinates");

  if (r.attribute_byte_count != 0)
    return log.report(violation::attribute_byte_count, where,
                      "attribute byte count should be '0', but got '" +
                          std::to_string(r.attribute_byte_count) + "'");
  return {};
}

}  // namespace stlcheck
