#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace etlq::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
/// Inputs are strings; outputs are lowercase strings with no side effects.
std::string to_lower(const std::string& s);
/// Converts a string to uppercase for keyword matching.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
/// Inputs are strings; outputs are uppercase strings with no side effects.
std::string to_upper(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

/// Splits on a single character, keeping empty fields.
std::vector<std::string> split(const std::string& s, char delimiter);

/// Parses the whole string as a base-10 integer; nullopt on any trailing junk.
std::optional<int64_t> parse_int64(const std::string& s);
/// Parses the whole string as a decimal number; nullopt on any trailing junk.
std::optional<double> parse_double(const std::string& s);

/// Matches SQL LIKE patterns where `%` is any run and `_` is one byte.
/// MUST be case-sensitive and MUST match the entire value.
/// Inputs are value/pattern; outputs are booleans with no side effects.
bool like_match(const std::string& value, const std::string& pattern);

/// Removes footnote markers trailing a display name (`[1]`, `*`, `†`, `‡`).
/// Inputs are column names; outputs are names without trailing markers.
std::string strip_footnotes(const std::string& name);

}  // namespace etlq::util
