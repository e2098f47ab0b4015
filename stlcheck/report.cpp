#include <stlcheck/report.hpp>

namespace stlcheck {

auto event_outcome_detail_note(const outcome& o) -> string {
  if (!o) return o.first_error_message;
  return "format=\""s + format_name + "\"; version=\"" +
         to_string(o.encoding) + "\"; result=\"errors: " +
         std::to_string(o.errors) +
         "; warnings: " + std::to_string(o.warnings) + "\"";
}

auto report(const filesystem::path& path, const outcome& o) -> json {
  if (!o) return failure_report(event_outcome_detail_note(o));
  return {
      {"eventOutcomeInformation", "pass"},
      {"eventOutcomeDetailNote", event_outcome_detail_note(o)},
      {"stdout", path.string() + " validates."},
  };
}

auto failure_report(string_view message) -> json {
  return {
      {"eventOutcomeInformation", "fail"},
      {"eventOutcomeDetailNote", string{message}},
      {"stdout", nullptr},
  };
}

auto serialize(const json& report) -> string {
  return report.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace stlcheck
