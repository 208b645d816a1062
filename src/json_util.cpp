// ============================================================================
// json_util.cpp - implementation for json_util.hpp
// ============================================================================
#include "meshbot/json_util.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace meshbot {

const nlohmann::json* json_find(const nlohmann::json& j, std::initializer_list<const char*> path) {
  const nlohmann::json* cur = &j;
  for (const char* key : path) {
    if (!cur->is_object()) return nullptr;
    auto it = cur->find(key);
    if (it == cur->end()) return nullptr;
    cur = &*it;
  }
  return cur->is_null() ? nullptr : cur;
}

std::optional<double> json_number(const nlohmann::json* v) {
  if (!v) return std::nullopt;
  if (v->is_number()) return v->get<double>();
  if (v->is_string()) {
    const std::string& s = v->get_ref<const std::string&>();
    if (s.empty()) return std::nullopt;
    char* e = nullptr;
    double d = std::strtod(s.c_str(), &e);
    if (!e || *e) return std::nullopt;          // trailing junk
    return d;
  }
  return std::nullopt;
}

std::optional<long long> json_integer(const nlohmann::json* v) {
  if (!v) return std::nullopt;
  if (v->is_number_unsigned()) {
    const auto u = v->get<unsigned long long>();
    if (u > static_cast<unsigned long long>(LLONG_MAX)) return std::nullopt;
    return static_cast<long long>(u);
  }
  if (v->is_number_integer()) return v->get<long long>();
  if (v->is_number_float()) {
    double d = v->get<double>();
    if (!std::isfinite(d) || std::floor(d) != d) return std::nullopt;
    // 2^63 is exact as a double; anything at or past it does not fit
    if (d < -9223372036854775808.0 || d >= 9223372036854775808.0) return std::nullopt;
    return static_cast<long long>(d);
  }
  if (v->is_string()) {
    const std::string& s = v->get_ref<const std::string&>();
    if (s.empty()) return std::nullopt;
    char* e = nullptr;
    errno = 0;
    long long n = std::strtoll(s.c_str(), &e, 10);
    if (!e || *e || errno == ERANGE) return std::nullopt;
    return n;
  }
  return std::nullopt;
}

std::optional<std::string> json_string(const nlohmann::json* v) {
  if (!v || !v->is_string()) return std::nullopt;
  return v->get<std::string>();
}

std::optional<bool> json_bool(const nlohmann::json* v) {
  if (!v || !v->is_boolean()) return std::nullopt;
  return v->get<bool>();
}

} // namespace meshbot
