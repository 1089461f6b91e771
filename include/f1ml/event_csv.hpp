#pragma once
#include <istream>
#include <optional>
#include <string>
#include <f1ml/event.hpp>

namespace f1ml {

// Stream-based CSV loaders (test-friendly; no filesystem required).
// The first non-comment line is the header; columns are matched by name in any
// order (year, round_number, driver_code, ... as written by the data collector).
// Lines starting with '#' and blank lines are ignored. Whitespace around fields
// is trimmed; double-quoted fields may contain commas. Empty or "nan" cells are
// missing values.

// Historical table. Rows without a parsable year, round_number and driver_code
// are skipped.
EventTable event_table_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<EventTable> load_event_table_csv(const std::string& path);

// Pre-race attributes of a single event. Outcome columns are ignored. A cell
// that fails to parse becomes missing (logged) and the row is kept; rows whose
// year/round differ from the first row are skipped. nullopt if no row is usable.
std::optional<TargetEvent> target_event_from_csv_stream(std::istream& in);

std::optional<TargetEvent> load_target_event_csv(const std::string& path);

} // namespace f1ml
