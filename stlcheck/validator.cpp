#include <stlcheck/stl_ascii_validator.hpp>
#include <stlcheck/stl_binary_validator.hpp>
#include <stlcheck/validator.hpp>

namespace stlcheck {

auto validate(istream& input,
              stl_encoding encoding,
              diagnostics::options opts,
              ostream& log) -> outcome {
  diagnostics d{opts, log};

  const auto result = [&] {
    if (encoding == stl_encoding::binary)
      return stl_binary_validator{d}.validate(input);
    return stl_ascii_validator{d}.validate(input);
  }();

  outcome o{};
  o.passed = result;
  o.encoding = encoding;
  o.errors = d.error_count();
  o.warnings = d.warning_count();
  o.first_error_message = d.first_error_message();
  return o;
}

auto validate(const filesystem::path& path,
              diagnostics::options opts,
              ostream& log) -> outcome {
  auto file = open_stl_file(path);
  const auto encoding = detect_format(file, filesystem::file_size(path));
  return validate(file, encoding, opts, log);
}

}  // namespace stlcheck
