#include "asset_files.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <unordered_map>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace assetxfer::upload {

namespace fs = std::filesystem;

namespace {

const std::unordered_map<std::string, std::string>& MimeTypes() {
  static const std::unordered_map<std::string, std::string> kMimeTypes = {
      {"png", "image/png"},
      {"jpg", "image/jpeg"},
      {"jpeg", "image/jpeg"},
      {"heic", "image/heic"},
      {"heif", "image/heif"},
      {"gif", "image/gif"},
      {"tif", "image/tiff"},
      {"tiff", "image/tiff"},
      {"webp", "image/webp"},
      {"mov", "video/quicktime"},
      {"mp4", "video/mp4"},
      {"m4v", "video/x-m4v"},
  };
  return kMimeTypes;
}

std::string Quoted(const fs::path& path) {
  return "\"" + path.string() + "\"";
}

} // namespace

std::string MimeTypeFor(const fs::path& path) {
  const auto& types = MimeTypes();
  auto        it    = types.find(storage::common::LowerExtension(path));
  return it == types.end() ? std::string() : it->second;
}

AssetFile ValidateAssetFile(const fs::path& path) {
  struct stat st{};
  if (::lstat(path.c_str(), &st) != 0) {
    throw std::system_error(errno, std::generic_category(), "stat " + path.string());
  }
  if (S_ISLNK(st.st_mode)) {
    throw util::FilesystemSafetyError("refusing to read symlink " + Quoted(path));
  }
  if (!S_ISREG(st.st_mode)) {
    throw std::invalid_argument("expected regular file: " + Quoted(path));
  }
  if (st.st_size <= 0) {
    throw std::invalid_argument("file is empty: " + Quoted(path));
  }
  if (::access(path.c_str(), R_OK) != 0) {
    throw std::system_error(errno, std::generic_category(), "read " + path.string());
  }

  auto mime_type = MimeTypeFor(path);
  if (mime_type.empty()) {
    throw std::invalid_argument("unsupported file type: " + Quoted(path));
  }

  return AssetFile{path, path.filename().string(), static_cast<int64_t>(st.st_size), std::move(mime_type)};
}

std::vector<fs::path> CollectAssetFiles(const fs::path& path) {
  struct stat st{};
  if (::lstat(path.c_str(), &st) != 0) {
    throw std::system_error(errno, std::generic_category(), "stat " + path.string());
  }
  if (S_ISLNK(st.st_mode)) {
    throw util::FilesystemSafetyError("refusing to read symlink " + Quoted(path));
  }

  if (!S_ISDIR(st.st_mode)) {
    ValidateAssetFile(path);
    return {path};
  }

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(path)) {
    if (entry.is_directory() && !entry.is_symlink()) {
      continue;
    }
    ValidateAssetFile(entry.path());
    files.push_back(entry.path());
  }
  if (files.empty()) {
    throw std::invalid_argument("no files found in " + Quoted(path));
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::shared_ptr<arrow::io::ReadableFile> OpenExistingNoFollow(const fs::path& path) {
  int fd = ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
  if (fd < 0) {
    if (errno == ELOOP) {
      throw util::FilesystemSafetyError("refusing to read symlink " + Quoted(path));
    }
    throw std::system_error(errno, std::generic_category(), "open " + path.string());
  }

  struct stat st{};
  if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
    ::close(fd);
    throw std::invalid_argument("expected regular file: " + Quoted(path));
  }

  // ReadableFile owns fd from here on.
  auto opened = arrow::io::ReadableFile::Open(fd);
  if (!opened.ok()) {
    ::close(fd);
  }
  return storage::common::Unwrap(opened);
}

} // namespace assetxfer::upload
