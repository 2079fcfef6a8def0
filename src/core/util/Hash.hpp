#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tgw {

std::string to_hex(const uint8_t* data, size_t len);

// Lowercase hex SHA-256 digest (64 chars).
std::string sha256_hex(std::string_view bytes);

// Length check plus constant-time byte comparison.
bool constant_time_equals(std::string_view a, std::string_view b);

} // namespace tgw
