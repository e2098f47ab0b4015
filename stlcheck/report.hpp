#pragma once
#include <stlcheck/validator.hpp>
//
#include <nlohmann/json.hpp>

namespace stlcheck {

using json = nlohmann::json;

constexpr czstring format_name = "STL (Standard Tessellation Language)";

auto event_outcome_detail_note(const outcome& o) -> string;

/// Generates the report of a validation run.
/// Successful runs carry a summary of the counted diagnostics
/// and failed runs the message of their first error.
///
auto report(const filesystem::path& path, const outcome& o) -> json;

/// Generates the report of a run that failed before any validation,
/// for example, because the file could not be read.
///
auto failure_report(string_view message) -> json;

/// Serializes a report to a single line.
/// Messages quote raw file content and paths are not required
/// to be valid UTF-8, so invalid bytes are replaced by U+FFFD.
///
auto serialize(const json& report) -> string;

}  // namespace stlcheck
