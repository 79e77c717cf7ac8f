#include "path_utils.hpp"

#include <algorithm>
#include <cctype>

namespace assetxfer::storage::common {

namespace {

bool IsRelativeComponent(const std::string& value) {
  return value.empty() || value == "." || value == "..";
}

} // namespace

std::string TrimSpace(const std::string& value) {
  auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
  auto end   = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string SanitizeBaseFileName(const std::string& value) {
  auto base = TrimSpace(value);
  if (base.empty()) {
    return {};
  }

  // Strip trailing separators so "dir/" does not collapse to an empty name.
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  base = TrimSpace(std::filesystem::path(base).filename().string());
  if (IsRelativeComponent(base)) {
    return {};
  }

  std::replace(base.begin(), base.end(), '/', '_');
  std::replace(base.begin(), base.end(), '\\', '_');
  base = TrimSpace(base);

  if (IsRelativeComponent(base)) {
    return {};
  }
  return base;
}

std::string LowerExtension(const std::filesystem::path& path) {
  auto ext = path.extension().string();
  if (!ext.empty() && ext.front() == '.') {
    ext.erase(0, 1);
  }
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

} // namespace assetxfer::storage::common
