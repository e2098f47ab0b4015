#include <stlcheck/stl_format.hpp>

namespace stlcheck {

auto to_string(stl_encoding encoding) -> string {
  switch (encoding) {
    case stl_encoding::ascii:
      return "ASCII";
    case stl_encoding::binary:
      return "binary";
  }
  return "unknown";
}

auto detect_format(uint64 file_size,
                   optional<stl_binary_format::size_type> count) noexcept
    -> stl_encoding {
  if (!count) return stl_encoding::ascii;
  if (stl_binary_format::file_size(*count) != file_size)
    return stl_encoding::ascii;
  return stl_encoding::binary;
}

auto detect_format(istream& input, uint64 file_size) -> stl_encoding {
  optional<stl_binary_format::size_type> triangle_count{};

  const auto position = input.tellg();
  stl_binary_format::header header{};
  array<uint8, stl_binary_format::size_field_size> size{};
  if (input.read(reinterpret_cast<char*>(header.data()), header.size()) &&
      input.read(reinterpret_cast<char*>(size.data()), size.size()))
    triangle_count =
        load_little_endian<stl_binary_format::size_type>(size.data());

  // Leave the stream as it was for the validator that is run afterwards.
  input.clear();
  input.seekg(position);

  return detect_format(file_size, triangle_count);
}

auto detect_format(const filesystem::path& path) -> stl_encoding {
  auto file = open_stl_file(path);
  return detect_format(file, filesystem::file_size(path));
}

auto open_stl_file(const filesystem::path& path) -> fstream {
  fstream file{path, ios::in | ios::binary};
  if (!file.is_open())
    throw runtime_error("Failed to open STL file from path '"s + path.string() +
                        "'.");
  return file;
}

}  // namespace stlcheck
