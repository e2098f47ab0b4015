#pragma once
#include <sstream>
//
#include <stlcheck/stl_binary_format.hpp>

namespace stlcheck::testing {

struct facet {
  vec3 normal;
  vec3 vertex[3];
  uint16 attribute_byte_count = 0;
};

// Counterclockwise facet in the xy-plane facing in z-direction.
inline auto unit_facet() -> facet {
  return {{0, 0, 1}, {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}}};
}

inline auto ascii_facet(const facet& f) -> string {
  ostringstream out{};
  const auto print = [&](vec3 v) { out << v.x << ' ' << v.y << ' ' << v.z; };
  out << "  facet normal ";
  print(f.normal);
  out << "\n    outer loop\n";
  for (const auto& v : f.vertex) {
    out << "      vertex ";
    print(v);
    out << '\n';
  }
  out << "    endloop\n  endfacet\n";
  return out.str();
}

inline auto ascii_stl(string_view name, const vector<facet>& facets) -> string {
  auto result = "solid "s + string{name} + '\n';
  for (const auto& f : facets) result += ascii_facet(f);
  result += "endsolid " + string{name} + '\n';
  return result;
}

inline void append_float(string& bytes, float32 value) {
  const auto data = bit_cast<array<char, sizeof(float32)>>(value);
  if constexpr (endian::native == endian::big)
    bytes.append(data.rbegin(), data.rend());
  else
    bytes.append(data.begin(), data.end());
}

template <typename type>
inline void append_integer(string& bytes, type value) {
  for (size_t i = 0; i < sizeof(type); ++i)
    bytes += static_cast<char>((value >> (8 * i)) & 0xff);
}

inline auto binary_stl(const vector<facet>& facets, uint32 count) -> string {
  string bytes(stl_binary_format::header_size, ' ');
  append_integer<uint32>(bytes, count);
  for (const auto& f : facets) {
    for (int i = 0; i < 3; ++i) append_float(bytes, f.normal[i]);
    for (const auto& v : f.vertex)
      for (int i = 0; i < 3; ++i) append_float(bytes, v[i]);
    append_integer<uint16>(bytes, f.attribute_byte_count);
  }
  return bytes;
}

inline auto binary_stl(const vector<facet>& facets) -> string {
  return binary_stl(facets, facets.size());
}

/// Writes test data to a file in the temporary directory
/// and removes it again when going out of scope.
///
struct temporary_file {
  temporary_file(string_view name, string_view content)
      : path{filesystem::temp_directory_path() / ("stlcheck_" + string{name})} {
    ofstream file{path, ios::binary};
    file.write(content.data(), content.size());
  }
  ~temporary_file() {
    error_code ec{};
    filesystem::remove(path, ec);
  }
  temporary_file(const temporary_file&) = delete;
  temporary_file& operator=(const temporary_file&) = delete;

  filesystem::path path;
};

}  // namespace stlcheck::testing
