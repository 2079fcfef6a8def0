#pragma once
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace tgw {

using nlohmann::json;

// Tri-state field: nullopt = caller did not mention it (leave unchanged),
// json null = clear it, anything else = set it.
using Field = std::optional<json>;

// Reads `key` from an argument object; nullopt when absent.
Field field(const json& args, const std::string& key);

// First of `keys` present in args, or nullptr. Used for parameter aliases.
const char* firstPresent(const json& args, std::initializer_list<const char*> keys);

// Throws ValidationError("Field '<key>' is required") when absent.
const json& require(const json& args, const std::string& key);

// Accepts a JSON integer, an integral float or an integral string
// ("42", " -7 ", "+3"). Anything else throws "<field> must be an integer".
int64_t parseInt(const json& value, const std::string& field);

// As parseInt(), but null maps to nullopt.
std::optional<int64_t> optionalInt(const json& value, const std::string& field);

// Field converter for integer-or-null update values.
json intOrNull(const json& value, const std::string& field);

std::string requireString(const json& value, const std::string& field);

// Absent or null -> nullopt, non-string -> ValidationError.
std::optional<std::string> optionalString(const json& args, const std::string& key);

// Requires a JSON array, or null when allowNull is set ("<field> must be a list").
json requireList(const json& value, const std::string& field, bool allowNull = true);

// Coerces a scalar-or-array parameter (repeatable query keys) to an array.
// null yields an empty array.
json asList(const json& value);

// Validates an ISO calendar date (YYYY-MM-DD) and returns it normalized.
std::string isoDate(const json& value, const std::string& field);

bool containsIgnoreCase(std::string_view haystack, std::string_view needle);

} // namespace tgw
