#include <stlcheck/stl_ascii_validator.hpp>

namespace stlcheck {

namespace {

constexpr auto is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' ||
         c == '\f';
}

constexpr auto is_digit(char c) noexcept { return '0' <= c && c <= '9'; }

constexpr auto facet_normal_pattern = "facet normal <float> <float> <float>";
constexpr auto vertex_pattern =
    "vertex <unsigned float> <unsigned float> <unsigned float>";

// Every facet consists of 'facet normal', 'outer loop',
// three vertices, 'endloop', and 'endfacet'.
constexpr size_t lines_per_facet = 7;

}  // namespace

auto normalize_whitespace(string_view line) -> string {
  string result{};
  result.reserve(line.size());
  bool space = false;
  for (auto c : line) {
    if (is_space(c)) {
      space = true;
      continue;
    }
    if (space && !result.empty()) result += ' ';
    space = false;
    result += c;
  }
  return result;
}

auto parse_number(string_view token) -> optional<real> {
  size_t i = 0;
  const auto digits = [&] {
    const auto first = i;
    while (i < token.size() && is_digit(token[i])) ++i;
    return i - first;
  };

  if (i < token.size() && token[i] == '-') ++i;
  auto mantissa = digits();
  if (i < token.size() && token[i] == '.') {
    ++i;
    const auto fraction = digits();
    if (fraction == 0) return {};
    mantissa += fraction;
  }
  if (i < token.size() && (token[i] == 'e' || token[i] == 'E')) {
    ++i;
    if (i < token.size() && (token[i] == '+' || token[i] == '-')) ++i;
    if (digits() == 0) return {};
  }
  if (i != token.size()) return {};

  if (mantissa == 0) return real(0);
  // 'strtof' needs a null-terminated string
  // and saturates to infinity on overflow.
  const string str{token};
  return std::strtof(str.c_str(), nullptr);
}

auto parse_vector(string_view line, string_view keyword) -> optional<vec3> {
  if (!line.starts_with(keyword)) return {};
  line.remove_prefix(keyword.size());

  vec3 result{};
  for (int i = 0; i < 3; ++i) {
    if (line.empty() || line.front() != ' ') return {};
    line.remove_prefix(1);
    const auto token = line.substr(0, line.find(' '));
    const auto value = parse_number(token);
    if (!value) return {};
    result[i] = *value;
    line.remove_prefix(token.size());
  }
  if (!line.empty()) return {};
  return result;
}

auto stl_ascii_validator::validate(istream& input) -> status {
  read_lines(input);

  if (auto s = check_header(); !s) return s;

  // The amount of facets is derived from the line count.
  // Any deviation from the structure is detected
  // by the line checks of the facets and the footer.
  facets = (lines.size() < 2) ? 0 : (lines.size() - 2) / lines_per_facet;
  for (size_t i = 0; i < facets; ++i)
    if (auto s = check_facet(); !s) return s;

  if (auto s = check_footer(); !s) return s;
  return check_end_of_input();
}

void stl_ascii_validator::read_lines(istream& input) {
  lines.clear();
  cursor = 0;
  name.clear();
  facets = 0;

  // Empty lines are only reported when followed by content.
  // Trailing empty lines at the end of the file are ignored.
  vector<uint64> empty_lines{};
  uint64 number = 0;
  for (string text; getline(input, text);) {
    ++number;
    auto normalized = normalize_whitespace(text);
    if (normalized.empty()) {
      empty_lines.push_back(number);
      continue;
    }
    for (auto n : empty_lines)
      log.warn(location::line(n), "line is empty");
    empty_lines.clear();
    lines.push_back({number, std::move(normalized)});
  }
  end_of_input = number + 1;
}

auto stl_ascii_validator::require_line(string_view expected) -> status {
  if (cursor < lines.size()) return {};
  return log.report(violation::unexpected_end_of_input,
                    location::line(end_of_input),
                    "unexpected end of input, expected '"s +
                        string{expected} + "'");
}

auto stl_ascii_validator::check_header() -> status {
  if (auto s = require_line("solid"); !s) return s;
  const auto& [number, text] = current();
  if (!text.starts_with("solid"))
    return log.report(violation::structure, location::line(number), "solid",
                      text);

  constexpr string_view keyword = "solid ";
  if (text.starts_with(keyword) && text.size() > keyword.size()) {
    name = text.substr(keyword.size());
  } else {
    log.warn(location::line(number), "solid <string>", text);
    name.clear();
  }
  ++cursor;
  return {};
}

auto stl_ascii_validator::check_facet() -> status {
  if (auto s = require_line(facet_normal_pattern); !s) return s;
  const auto facet_line = current().number;
  const auto normal = parse_vector(current().text, "facet normal");
  if (!normal)
    return log.report(violation::structure, location::line(facet_line),
                      facet_normal_pattern, current().text);
  ++cursor;

  if (auto s = check_keyword("outer loop"); !s) return s;

  vec3 vertex[3];
  for (auto& v : vertex)
    if (auto s = check_vertex(v); !s) return s;

  if (!counterclockwise(vertex[0], vertex[1], vertex[2], *normal))
    if (auto s = log.report(violation::winding_order,
                            location::line(facet_line),
                            "vertices of facet are not ordered "
                            "counterclockwise");
        !s)
      return s;

  if (auto s = check_keyword("endloop"); !s) return s;
  return check_keyword("endfacet");
}

auto stl_ascii_validator::check_vertex(vec3& vertex) -> status {
  if (auto s = require_line(vertex_pattern); !s) return s;
  const auto& [number, text] = current();
  const auto v = parse_vector(text, "vertex");
  if (!v)
    return log.report(violation::structure, location::line(number),
                      vertex_pattern, text);
  vertex = *v;
  ++cursor;

  if (vertex.x < 0 || vertex.y < 0 || vertex.z < 0)
    return log.report(violation::negative_vertex, location::line(number),
                      "not all vertices have positive values");
  return {};
}

auto stl_ascii_validator::check_keyword(string_view keyword) -> status {
  if (auto s = require_line(keyword); !s) return s;
  const auto& [number, text] = current();
  if (text != keyword)
    return log.report(violation::structure, location::line(number),
                      string{keyword}, text);
  ++cursor;
  return {};
}

auto stl_ascii_validator::check_footer() -> status {
  if (auto s = require_line("endsolid"); !s) return s;
  const auto& [number, text] = current();
  if (!text.starts_with("endsolid"))
    return log.report(violation::structure, location::line(number),
                      "endsolid", text);
  ++cursor;

  if (name.empty()) return {};
  const auto expected = "endsolid "s + name;
  if (text != expected)
    return log.report(violation::solid_name_mismatch, location::line(number),
                      expected, text);
  return {};
}

auto stl_ascii_validator::check_end_of_input() -> status {
  if (cursor == lines.size()) return {};
  const auto& [number, text] = current();
  return log.report(violation::structure, location::line(number),
                    "end of input", text);
}

}  // namespace stlcheck
