#pragma once

#include <string>
#include <string_view>

namespace orchestra::util {

// Lowercase hex SHA-256 of the given bytes.
[[nodiscard]] auto sha256_hex(std::string_view data) -> std::string;

}  // namespace orchestra::util
