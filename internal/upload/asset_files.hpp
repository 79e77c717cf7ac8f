#pragma once

#include <arrow/io/file.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace assetxfer::upload {

// A local file that passed validation and may be uploaded.
struct AssetFile {
  std::filesystem::path path;
  std::string           file_name;
  int64_t               size = 0;
  std::string           mime_type;
};

// MIME type by extension, empty for unsupported types.
std::string MimeTypeFor(const std::filesystem::path& path);

/*
  Checks that `path` is an existing, non-empty regular file of a supported
  type. Symlinks are refused with FilesystemSafetyError, everything else with
  std::invalid_argument.
*/
AssetFile ValidateAssetFile(const std::filesystem::path& path);

/*
  A file path yields itself; a directory yields its non-directory entries,
  each validated, sorted by path. Refuses a symlinked path and an empty
  directory.
*/
std::vector<std::filesystem::path> CollectAssetFiles(const std::filesystem::path& path);

/*
  Opens an existing regular file for reading without following a symlink at
  the final component.
*/
std::shared_ptr<arrow::io::ReadableFile> OpenExistingNoFollow(const std::filesystem::path& path);

} // namespace assetxfer::upload
