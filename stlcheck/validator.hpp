#pragma once
#include <stlcheck/diagnostics.hpp>
#include <stlcheck/stl_format.hpp>

namespace stlcheck {

struct outcome {
  operator bool() const noexcept { return passed; }

  bool passed = false;
  stl_encoding encoding = stl_encoding::ascii;
  size_t errors = 0;
  size_t warnings = 0;
  string first_error_message{};
};

/// Validates the STL file at the given path.
/// The encoding is detected first and the file is then checked
/// by the ASCII or binary validator.
/// Failing to open the file throws 'runtime_error'.
///
auto validate(const filesystem::path& path,
              diagnostics::options opts = {},
              ostream& log = cout) -> outcome;

auto validate(istream& input,
              stl_encoding encoding,
              diagnostics::options opts = {},
              ostream& log = cout) -> outcome;

}  // namespace stlcheck
