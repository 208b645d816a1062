// -----------------------------------------------------------------------------
// text_util.cpp - string helpers for MeshBot
//
// API & contracts: see include/meshbot/text_util.hpp
// Tests:           see tests/test_text_util.cpp
// -----------------------------------------------------------------------------
#include "meshbot/text_util.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace meshbot {

// ---------- whitespace & case ----------

static bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && is_space(s[b])) ++b;          // leading
  while (e > b && is_space(s[e - 1])) --e;      // trailing
  return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
  for (auto& c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

std::vector<std::string> split_ws(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (is_space(c)) {
      if (!cur.empty()) { out.push_back(cur); cur.clear(); }
    } else {
      cur += c;
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

// ---------- UTF-8 ----------

static bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

size_t utf8_length(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s)
    if (!is_continuation(c)) ++n;
  return n;
}

std::string clamp(const std::string& s, size_t n) {
  if (utf8_length(s) <= n) return s;
  if (n == 0) return {};

  // walk forward to the byte offset where code point n-1 starts
  const size_t keep = n - 1;
  size_t seen = 0, i = 0;
  for (; i < s.size(); ++i) {
    if (!is_continuation(static_cast<unsigned char>(s[i]))) {
      if (seen == keep) break;
      ++seen;
    }
  }
  return s.substr(0, i) + ELLIPSIS;
}

// ---------- durations ----------

std::string format_duration(uint64_t seconds) {
  const uint64_t days = seconds / 86400; seconds %= 86400;
  const uint64_t hours = seconds / 3600; seconds %= 3600;
  const uint64_t minutes = seconds / 60; seconds %= 60;

  std::vector<std::string> parts;
  if (days)    parts.push_back(std::to_string(days) + "d");
  if (hours)   parts.push_back(std::to_string(hours) + "h");
  if (minutes) parts.push_back(std::to_string(minutes) + "m");
  parts.push_back(std::to_string(seconds) + "s");
  return join(parts, " ");
}

std::string format_age(uint64_t seconds) {
  if (seconds < 60) return std::to_string(seconds) + "s";
  uint64_t minutes = seconds / 60;
  if (minutes < 60) return std::to_string(minutes) + "m";
  uint64_t hours = minutes / 60; minutes %= 60;
  if (hours < 24) return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
  const uint64_t days = hours / 24; hours %= 24;
  return std::to_string(days) + "d " + std::to_string(hours) + "h";
}

// ---------- numbers ----------

std::string format_percent(const std::optional<double>& v) {
  if (!v || !std::isfinite(*v)) return "?";
  const double r = std::round(*v);
  char buf[32];
  if (std::fabs(*v - r) < 1e-9) std::snprintf(buf, sizeof(buf), "%.0f%%", r);
  else                          std::snprintf(buf, sizeof(buf), "%.1f%%", *v);
  return buf;
}

std::string format_number(double v) {
  std::ostringstream os;
  os << v;                       // default stream precision: 6 significant digits
  return os.str();
}

} // namespace meshbot
