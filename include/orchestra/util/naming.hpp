#pragma once

#include <string>
#include <string_view>

namespace orchestra::util {

// Maps a port name or id onto one safe path component: anything outside
// [A-Za-z0-9._-] becomes '_', and empty or all-dot results are prefixed
// with '_' so "." and ".." never reach the filesystem as-is.
[[nodiscard]] auto sanitize_file_name(std::string_view name) -> std::string;

}  // namespace orchestra::util
