#pragma once

#include <filesystem>
#include <string>

namespace assetxfer::storage::common {

/*
  Reduce an untrusted remote file name to a single path component.

  Returns an empty string when nothing usable remains, so callers can fall
  back to an id-derived name. Never yields "." or "..".
*/
std::string SanitizeBaseFileName(const std::string& value);

std::string TrimSpace(const std::string& value);

// Lowercased extension without the dot, e.g. "png". Empty if none.
std::string LowerExtension(const std::filesystem::path& path);

} // namespace assetxfer::storage::common
