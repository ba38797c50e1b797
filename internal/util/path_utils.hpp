#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace orchestra::util {

/*
  Resource context comparison key.

  Backslashes become forward slashes, trailing separators are trimmed and
  the result is lowercased, so "C:\repo\" and "c:/repo" compare equal.
*/
inline std::string NormalizeResourceContext(std::string_view context) {
  std::string out(context);
  std::replace(out.begin(), out.end(), '\\', '/');
  while (!out.empty() && out.back() == '/') {
    out.pop_back();
  }
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// False when either side is empty.
inline bool SameResourceContext(std::string_view lhs, std::string_view rhs) {
  if (lhs.empty() || rhs.empty()) {
    return false;
  }
  return NormalizeResourceContext(lhs) == NormalizeResourceContext(rhs);
}

// Last path component, accepting either separator.
inline std::string ContextBaseName(std::string_view context) {
  std::string trimmed(context);
  while (!trimmed.empty() && (trimmed.back() == '/' || trimmed.back() == '\\')) {
    trimmed.pop_back();
  }
  const auto pos = trimmed.find_last_of("/\\");
  return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

} // namespace orchestra::util
