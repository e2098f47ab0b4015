#pragma once
#include <stlcheck/stl_binary_format.hpp>

namespace stlcheck {

enum class stl_encoding { ascii, binary };

auto to_string(stl_encoding encoding) -> string;

/// Classifies an STL file by its size and the triangle count
/// stored right after the 80-byte header.
/// There is no format marker in STL files.
/// A file is only considered binary if its size exactly matches
/// the size implied by the triangle count.
/// Textual files that coincidentally fulfill this condition
/// will therefore be classified as binary.
///
auto detect_format(uint64 file_size,
                   optional<stl_binary_format::size_type> count) noexcept
    -> stl_encoding;

auto detect_format(istream& input, uint64 file_size) -> stl_encoding;

auto detect_format(const filesystem::path& path) -> stl_encoding;

/// Opens an STL file for binary reading.
/// Throws 'runtime_error' if the file cannot be opened.
///
auto open_stl_file(const filesystem::path& path) -> fstream;

}  // namespace stlcheck
