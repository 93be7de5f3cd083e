#include "string_util.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace etlq::util {

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string to_upper(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(delimiter, start);
    if (pos == std::string::npos) {
      out.push_back(s.substr(start));
      break;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

std::optional<int64_t> parse_int64(const std::string& s) {
  if (s.empty()) return std::nullopt;
  size_t i = (s[0] == '-' || s[0] == '+') ? 1 : 0;
  if (i == s.size()) return std::nullopt;
  for (size_t j = i; j < s.size(); ++j) {
    if (!std::isdigit(static_cast<unsigned char>(s[j]))) return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(s.c_str(), &end, 10);
  if (errno == ERANGE || end != s.c_str() + s.size()) return std::nullopt;
  return static_cast<int64_t>(value);
}

std::optional<double> parse_double(const std::string& s) {
  if (s.empty() || std::isspace(static_cast<unsigned char>(s[0]))) return std::nullopt;
  // strtod accepts hex, inf and nan; restrict to plain decimal forms.
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)) && c != '-' && c != '+' && c != '.' && c != 'e' &&
        c != 'E') {
      return std::nullopt;
    }
  }
  errno = 0;
  char* end = nullptr;
  double value = std::strtod(s.c_str(), &end);
  if (errno == ERANGE || end != s.c_str() + s.size()) return std::nullopt;
  return value;
}

bool like_match(const std::string& value, const std::string& pattern) {
  size_t v = 0;
  size_t p = 0;
  size_t star_p = std::string::npos;
  size_t star_v = 0;
  while (v < value.size()) {
    if (p < pattern.size() && (pattern[p] == '_' || pattern[p] == value[v])) {
      ++v;
      ++p;
    } else if (p < pattern.size() && pattern[p] == '%') {
      star_p = p++;
      star_v = v;
    } else if (star_p != std::string::npos) {
      p = star_p + 1;
      v = ++star_v;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '%') {
    ++p;
  }
  return p == pattern.size();
}

std::string strip_footnotes(const std::string& name) {
  static const std::string kDagger = "\xE2\x80\xA0";
  static const std::string kDoubleDagger = "\xE2\x80\xA1";
  std::string out = trim_ws(name);
  bool changed = true;
  while (changed && !out.empty()) {
    changed = false;
    if (out.back() == '*') {
      out.pop_back();
      changed = true;
    } else if (ends_with(out, kDagger)) {
      out.resize(out.size() - kDagger.size());
      changed = true;
    } else if (ends_with(out, kDoubleDagger)) {
      out.resize(out.size() - kDoubleDagger.size());
      changed = true;
    } else if (out.back() == ']') {
      size_t open = out.rfind('[');
      if (open != std::string::npos && open > 0) {
        out.resize(open);
        changed = true;
      }
    }
    if (changed) out = trim_ws(out);
  }
  return out;
}

}  // namespace etlq::util
