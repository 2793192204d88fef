#pragma once

// Shared CLI parsing helpers for the ParcelCity command line tools.
//
// Kept header-only and separate from the core so tests can exercise the exact
// parsing rules the CLI uses (strict integers, x,y,type placements).

#include <cctype>
#include <charconv>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace parcelcity::cli {

inline bool EnsureParentDir(const std::filesystem::path& file)
{
  if (file.empty()) return false;
  std::error_code ec;
  const std::filesystem::path parent = file.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) return false;
  }
  return true;
}

inline bool ParseI32(std::string_view s, int* out)
{
  if (!out) return false;
  if (s.empty()) return false;

  // std::from_chars does not accept a leading '+'.
  if (s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return false;

  int v = 0;
  const char* begin = s.data();
  const char* end = s.data() + s.size();
  const auto res = std::from_chars(begin, end, v, 10);
  if (res.ec != std::errc() || res.ptr != end) return false;
  *out = v;
  return true;
}

inline std::vector<std::string> SplitCommaList(std::string_view s)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      out.push_back(cur);
      cur.clear();
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    cur.push_back(c);
  }
  out.push_back(cur);
  return out;
}

// "x,y,type" placement request, e.g. "2,3,residential".
inline bool ParsePlacement(std::string_view s, int* outX, int* outY, std::string* outType)
{
  if (!outX || !outY || !outType) return false;
  const std::vector<std::string> parts = SplitCommaList(s);
  if (parts.size() != 3 || parts[2].empty()) return false;
  int x = 0;
  int y = 0;
  if (!ParseI32(parts[0], &x) || !ParseI32(parts[1], &y)) return false;
  *outX = x;
  *outY = y;
  *outType = parts[2];
  return true;
}

} // namespace parcelcity::cli
