#include <stlcheck/diagnostics.hpp>

namespace stlcheck {

auto to_string(location where) -> string {
  switch (where.kind) {
    case location::unit::line:
      return "line "s + std::to_string(where.value);
    case location::unit::byte_offset:
      return "byte offset "s + std::to_string(where.value);
  }
  return std::to_string(where.value);
}

auto diagnostic::message() const -> string {
  auto result = (level == severity::error) ? "Error on "s : "Warning on "s;
  result += to_string(where) + ": ";
  if (actual)
    result += "Expected '" + expected + "' but got '" + *actual + "'.";
  else
    result += expected + ".";
  return result;
}

auto diagnostics::classify(violation kind) const noexcept -> severity {
  switch (kind) {
    case violation::structure:
    case violation::unexpected_end_of_input:
    case violation::not_a_number:
    case violation::attribute_byte_count:
      return severity::error;
    case violation::empty_line:
    case violation::missing_solid_name:
      return severity::warning;
    case violation::negative_vertex:
    case violation::winding_order:
    case violation::solid_name_mismatch:
      return opts.strict ? severity::error : severity::warning;
  }
  return severity::error;
}

auto diagnostics::report(violation kind,
                         location where,
                         string expected,
                         optional<string> actual) -> status {
  if (classify(kind) == severity::warning) {
    warn(where, std::move(expected), std::move(actual));
    return {};
  }
  return error(where, std::move(expected), std::move(actual));
}

void diagnostics::warn(location where,
                       string expected,
                       optional<string> actual) {
  ++warnings;
  if (!opts.verbose) return;
  const diagnostic d{severity::warning, where, std::move(expected),
                     std::move(actual)};
  *log << d.message() << '\n';
}

auto diagnostics::error(location where,
                        string expected,
                        optional<string> actual) -> status {
  ++errors;
  diagnostic d{severity::error, where, std::move(expected), std::move(actual)};
  if (first_error.empty()) first_error = d.message();
  return d;
}

auto diagnostics::soft_violation(location where,
                                 string expected,
                                 optional<string> actual) -> status {
  if (!opts.strict) {
    warn(where, std::move(expected), std::move(actual));
    return {};
  }
  return error(where, std::move(expected), std::move(actual));
}

}  // namespace stlcheck
