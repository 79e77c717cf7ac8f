#pragma once

#include <sys/types.h>

#include <arrow/io/interfaces.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

namespace assetxfer::storage {

/*
  Crash-safe file writer.

  Properties:
    - content is staged in a temp file in the destination's own directory
    - temp file is fsync'ed before it becomes visible at the destination
    - overwrite: rename over the destination, backup-swap if the rename is refused
    - no-overwrite: link into place, failing if the destination appeared meanwhile;
      where hard links are unsupported, renameat2(RENAME_NOREPLACE), then an
      exclusive create plus copy
    - symlink and directory destinations are refused
    - temp files are removed on every failure path

  At every point before Write() returns, the destination holds either its
  original content or nothing (if it did not exist).
*/
class AtomicFileWriter {
 public:
  // Receives the temp file stream, returns the number of bytes written.
  using WriteFn = std::function<int64_t(arrow::io::OutputStream&)>;

  // Same contract as rename(2). Injectable so the backup-swap path is testable.
  using RenameFn = std::function<std::error_code(const std::filesystem::path& from, const std::filesystem::path& to)>;

  // Same contract as link(2) or renameat2(RENAME_NOREPLACE): never replaces `to`.
  using PublishFn = std::function<std::error_code(const std::filesystem::path& from, const std::filesystem::path& to)>;

  struct Options {
    std::string temp_prefix   = ".assetxfer-tmp-";
    std::string backup_prefix = ".assetxfer-backup-";
    RenameFn    rename;
    PublishFn   link;
    PublishFn   rename_no_replace;
  };

  AtomicFileWriter();
  explicit AtomicFileWriter(Options options);

  /*
    Throws FilesystemSafetyError for symlink/directory destinations and for an
    existing destination in no-overwrite mode. Errors from `write` propagate
    unchanged after the temp file is removed.
  */
  int64_t Write(const std::filesystem::path& destination, mode_t permissions, bool overwrite, const WriteFn& write) const;

 private:
  std::error_code Rename(const std::filesystem::path& from, const std::filesystem::path& to) const;
  std::error_code Link(const std::filesystem::path& from, const std::filesystem::path& to) const;
  std::error_code RenameNoReplace(const std::filesystem::path& from, const std::filesystem::path& to) const;

  // Returns true when the temp name was moved (not copied) into place.
  bool PublishNoReplace(const std::filesystem::path& temp_path, const std::filesystem::path& destination, mode_t permissions) const;

  void ReplaceDestination(const std::filesystem::path& temp_path, const std::filesystem::path& destination, bool had_existing) const;

  Options options_;
};

} // namespace assetxfer::storage
