#pragma once
#include <stlcheck/utility.hpp>

namespace stlcheck {

enum class severity { error, warning };

enum class violation {
  // Always errors.
  structure,
  unexpected_end_of_input,
  not_a_number,
  attribute_byte_count,
  // Always warnings.
  empty_line,
  missing_solid_name,
  // Severity depends on the strictness of the validation.
  negative_vertex,
  winding_order,
  solid_name_mismatch,
};

/// Where a diagnostic occurred in the validated file.
/// Textual files are addressed by one-based line numbers
/// and binary files by byte offsets.
///
struct location {
  enum class unit { line, byte_offset };

  static constexpr auto line(uint64 number) noexcept {
    return location{unit::line, number};
  }
  static constexpr auto byte_offset(uint64 offset) noexcept {
    return location{unit::byte_offset, offset};
  }

  unit kind = unit::line;
  uint64 value = 0;
};

auto to_string(location where) -> string;

struct diagnostic {
  auto message() const -> string;

  severity level = severity::error;
  location where{};
  string expected{};
  optional<string> actual{};
};

/// Result of a single validation step.
/// It evaluates to 'true' on success and otherwise
/// carries the diagnostic of the error that aborted the validation.
///
struct [[nodiscard]] status {
  status() = default;
  status(diagnostic d) : failure{std::move(d)} {}

  operator bool() const noexcept { return !failure.has_value(); }

  optional<diagnostic> failure{};
};

/// Counts all reported diagnostics of a validation run
/// and decides which violations are fatal.
///
class diagnostics {
 public:
  struct options {
    // Soft violations are treated as errors.
    bool strict = true;
    // Every warning is printed to the log stream.
    bool verbose = false;
  };

  diagnostics() = default;
  explicit diagnostics(options opts, ostream& log = cout)
      : opts{opts}, log{&log} {}

  auto classify(violation kind) const noexcept -> severity;

  auto report(violation kind,
              location where,
              string expected,
              optional<string> actual = {}) -> status;

  void warn(location where, string expected, optional<string> actual = {});
  auto error(location where, string expected, optional<string> actual = {})
      -> status;
  auto soft_violation(location where,
                      string expected,
                      optional<string> actual = {}) -> status;

  auto error_count() const noexcept { return errors; }
  auto warning_count() const noexcept { return warnings; }
  auto first_error_message() const noexcept -> const string& {
    return first_error;
  }
  auto strict() const noexcept { return opts.strict; }
  auto verbose() const noexcept { return opts.verbose; }

 private:
  options opts{};
  ostream* log = &cout;
  size_t errors = 0;
  size_t warnings = 0;
  string first_error{};
};

}  // namespace stlcheck
