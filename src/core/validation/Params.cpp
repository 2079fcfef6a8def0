#include "Params.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>

#include "core/errors/Errors.hpp"

namespace tgw {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

static std::optional<int64_t> parse_integral(std::string_view s) {
  s = trim(s);
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;
  int64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

static bool is_leap(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

Field field(const json& args, const std::string& key) {
  if (!args.is_object()) return std::nullopt;
  auto it = args.find(key);
  if (it == args.end()) return std::nullopt;
  return *it;
}

const char* firstPresent(const json& args, std::initializer_list<const char*> keys) {
  if (!args.is_object()) return nullptr;
  for (const char* k : keys) {
    if (args.contains(k)) return k;
  }
  return nullptr;
}

const json& require(const json& args, const std::string& key) {
  if (args.is_object()) {
    auto it = args.find(key);
    if (it != args.end()) return *it;
  }
  throw ValidationError("Field '" + key + "' is required");
}

int64_t parseInt(const json& value, const std::string& field) {
  if (value.is_number_unsigned()) {
    if (value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return value.get<int64_t>();
    }
  } else if (value.is_number_integer()) {
    return value.get<int64_t>();
  }
  if (value.is_number_float()) {
    double d = value.get<double>();
    // [-2^63, 2^63) is exactly the range that converts without overflow.
    if (std::isfinite(d) && std::trunc(d) == d && d >= -9223372036854775808.0 &&
        d < 9223372036854775808.0) {
      return static_cast<int64_t>(d);
    }
  }
  if (value.is_string()) {
    if (auto v = parse_integral(value.get_ref<const std::string&>())) return *v;
  }
  throw ValidationError(field + " must be an integer");
}

std::optional<int64_t> optionalInt(const json& value, const std::string& field) {
  if (value.is_null()) return std::nullopt;
  return parseInt(value, field);
}

json intOrNull(const json& value, const std::string& field) {
  auto v = optionalInt(value, field);
  return v ? json(*v) : json(nullptr);
}

std::string requireString(const json& value, const std::string& field) {
  if (!value.is_string()) throw ValidationError(field + " must be a string");
  return value.get<std::string>();
}

std::optional<std::string> optionalString(const json& args, const std::string& key) {
  auto v = field(args, key);
  if (!v || v->is_null()) return std::nullopt;
  return requireString(*v, key);
}

json requireList(const json& value, const std::string& field, bool allowNull) {
  if (value.is_array()) return value;
  if (allowNull && value.is_null()) return value;
  throw ValidationError(field + " must be a list");
}

json asList(const json& value) {
  if (value.is_array()) return value;
  if (value.is_null()) return json::array();
  return json::array({value});
}

std::string isoDate(const json& value, const std::string& field) {
  const std::string err = field + " must be in YYYY-MM-DD format";
  if (!value.is_string()) throw ValidationError(err);
  const auto& s = value.get_ref<const std::string&>();
  if (s.size() != 10 || s[4] != '-' || s[7] != '-') throw ValidationError(err);
  for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) throw ValidationError(err);
  }
  const int y = std::stoi(s.substr(0, 4));
  const int m = std::stoi(s.substr(5, 2));
  const int d = std::stoi(s.substr(8, 2));
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (y < 1 || m < 1 || m > 12 || d < 1) throw ValidationError(err);
  int maxDay = kDays[m - 1] + ((m == 2 && is_leap(y)) ? 1 : 0);
  if (d > maxDay) throw ValidationError(err);
  return s;
}

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                        [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                        });
  return it != haystack.end();
}

} // namespace tgw
