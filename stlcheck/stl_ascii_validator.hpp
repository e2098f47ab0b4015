#pragma once
#include <stlcheck/diagnostics.hpp>
#include <stlcheck/math.hpp>

namespace stlcheck {

/// Collapses every run of whitespace to a single space
/// and removes leading and trailing whitespace.
///
auto normalize_whitespace(string_view line) -> string;

/// Parses a single numeric token of the STL ASCII grammar.
/// The accepted tokens are described by
/// '-?[0-9]*(\.[0-9]+)?([Ee][+-]?[0-9]+)?'.
/// This includes a bare sign and an exponent without mantissa.
/// Such tokens carry no digits and are read as zero.
///
auto parse_number(string_view token) -> optional<real>;

/// Parses a normalized line of the form '<keyword> <f> <f> <f>'.
///
auto parse_vector(string_view line, string_view keyword) -> optional<vec3>;

/// Line-based state machine checking the STL ASCII grammar
///
///   solid <name>
///     { facet normal <f> <f> <f>
///         outer loop
///           vertex <f> <f> <f>
///           vertex <f> <f> <f>
///           vertex <f> <f> <f>
///         endloop
///       endfacet }*
///   endsolid <name>
///
/// on whitespace-normalized lines.
/// In contrast to the grammar published with the format,
/// a solid may be empty and vertex coordinates may be negative.
/// Negative coordinates are reported as soft violations instead.
///
class stl_ascii_validator {
 public:
  explicit stl_ascii_validator(diagnostics& log) noexcept : log{log} {}

  auto validate(istream& input) -> status;

  auto solid_name() const noexcept -> const string& { return name; }
  auto facet_count() const noexcept { return facets; }

 private:
  struct line {
    uint64 number;
    string text;
  };

  void read_lines(istream& input);

  auto require_line(string_view expected) -> status;
  auto current() const noexcept -> const line& { return lines[cursor]; }

  auto check_header() -> status;
  auto check_facet() -> status;
  auto check_vertex(vec3& vertex) -> status;
  auto check_keyword(string_view keyword) -> status;
  auto check_footer() -> status;
  auto check_end_of_input() -> status;

  diagnostics& log;
  vector<line> lines{};
  size_t cursor = 0;
  uint64 end_of_input = 1;
  string name{};
  size_t facets = 0;
};

}  // namespace stlcheck
