#include "etlq/datasource.h"

#include <cctype>

#include "util/string_util.h"

namespace etlq {

namespace {

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

/// Accepts YYYY-MM-DD calendar dates only.
bool is_iso_date(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
  for (size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) continue;
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  int year = std::stoi(text.substr(0, 4));
  int month = std::stoi(text.substr(5, 2));
  int day = std::stoi(text.substr(8, 2));
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12 || day < 1) return false;
  int max_day = kDays[month - 1];
  if (month == 2 && is_leap_year(year)) max_day = 29;
  return day <= max_day;
}

}  // namespace

std::optional<RemoteDescriptor> parse_remote_descriptor(const std::string& text, std::string& error) {
  std::vector<std::string> fields = util::split(text, '|');
  if (fields.size() != 7) {
    error = "expected 7 fields project|dataset|start_date|end_date|longitude|latitude|scale, got " +
            std::to_string(fields.size());
    return std::nullopt;
  }
  for (auto& field : fields) {
    field = util::trim_ws(field);
  }
  RemoteDescriptor out;
  out.project = fields[0];
  out.dataset = fields[1];
  out.start_date = fields[2];
  out.end_date = fields[3];
  if (out.project.empty() || out.dataset.empty()) {
    error = "project and dataset must not be empty";
    return std::nullopt;
  }
  if (!is_iso_date(out.start_date)) {
    error = "start_date '" + out.start_date + "' is not an ISO date (YYYY-MM-DD)";
    return std::nullopt;
  }
  if (!is_iso_date(out.end_date)) {
    error = "end_date '" + out.end_date + "' is not an ISO date (YYYY-MM-DD)";
    return std::nullopt;
  }
  // Fixed-width ISO dates order lexicographically.
  if (out.start_date > out.end_date) {
    error = "start_date must not be after end_date";
    return std::nullopt;
  }
  auto longitude = util::parse_double(fields[4]);
  auto latitude = util::parse_double(fields[5]);
  auto scale = util::parse_double(fields[6]);
  if (!longitude.has_value()) {
    error = "longitude '" + fields[4] + "' is not a decimal number";
    return std::nullopt;
  }
  if (!latitude.has_value()) {
    error = "latitude '" + fields[5] + "' is not a decimal number";
    return std::nullopt;
  }
  if (!scale.has_value() || *scale <= 0.0) {
    error = "scale '" + fields[6] + "' must be a positive decimal number";
    return std::nullopt;
  }
  out.longitude = *longitude;
  out.latitude = *latitude;
  out.scale = *scale;
  return out;
}

}  // namespace etlq
