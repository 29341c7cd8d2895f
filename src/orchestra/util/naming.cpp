#include "orchestra/util/naming.hpp"

#include <algorithm>

namespace orchestra::util {

auto sanitize_file_name(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size() + 1);
  for (char c : name) {
    bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    out.push_back(safe ? c : '_');
  }
  if (std::ranges::all_of(out, [](char c) { return c == '.'; })) {
    out.insert(out.begin(), '_');
  }
  return out;
}

}  // namespace orchestra::util
