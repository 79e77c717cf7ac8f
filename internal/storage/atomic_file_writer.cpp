#include "atomic_file_writer.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <arrow/io/file.h>

#include <cerrno>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <utility>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace assetxfer::storage {

namespace fs = std::filesystem;

using common::Unwrap;

namespace {

constexpr int     kMaxTempNameAttempts = 100;
constexpr int64_t kCopyChunkSize       = 1 << 20;

/*
  State of one Write() call. Never outlives it.
*/
struct WriteTransaction {
  fs::path destination_path;
  fs::path temporary_path;
  bool     had_existing_file = false;
};

[[noreturn]] void ThrowErrno(int err, const std::string& what, const fs::path& path) {
  throw std::system_error(err, std::generic_category(), what + " " + path.string());
}

std::string Quoted(const fs::path& path) {
  return "\"" + path.string() + "\"";
}

/*
  Removes the temp file unless the caller marks it as consumed.
*/
class TempFileGuard {
 public:
  explicit TempFileGuard(fs::path path) : path_(std::move(path)) {
  }

  ~TempFileGuard() {
    if (!consumed_) {
      ::unlink(path_.c_str());
    }
  }

  TempFileGuard(const TempFileGuard&)            = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  void MarkConsumed() {
    consumed_ = true;
  }

 private:
  fs::path path_;
  bool     consumed_ = false;
};

// Exclusive create of `<dir>/<prefix><random>`, never following symlinks.
std::pair<fs::path, int> CreateTempFile(const fs::path& dir, const std::string& prefix) {
  for (int i = 0; i < kMaxTempNameAttempts; ++i) {
    auto path = dir / (prefix + util::RandomToken());
    int  fd   = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd >= 0) {
      return {path, fd};
    }
    if (errno != EEXIST) {
      ThrowErrno(errno, "create temp file in", dir);
    }
  }
  throw std::runtime_error("could not find a free temp file name in " + dir.string());
}

fs::path UnusedSiblingPath(const fs::path& dir, const std::string& prefix) {
  for (int i = 0; i < kMaxTempNameAttempts; ++i) {
    auto        path = dir / (prefix + util::RandomToken());
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0 && errno == ENOENT) {
      return path;
    }
  }
  throw std::runtime_error("could not find a free backup file name in " + dir.string());
}

// mkdir -p with 0755 for every missing component.
void MakeDirectories(const fs::path& dir) {
  fs::path partial;
  for (const auto& part : dir) {
    partial /= part;
    if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
      ThrowErrno(errno, "create directory", partial);
    }
  }
  struct stat st{};
  if (::stat(dir.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
    throw std::system_error(ENOTDIR, std::generic_category(), "create directory " + dir.string());
  }
}

fs::path ParentDirectory(const fs::path& destination) {
  auto dir = destination.parent_path();
  return dir.empty() ? fs::path(".") : dir;
}

// Errors meaning "this filesystem cannot do that", as opposed to a real failure.
bool IsUnsupported(const std::error_code& ec) {
  if (ec.category() != std::generic_category() && ec.category() != std::system_category()) {
    return false;
  }
  switch (ec.value()) {
    case EPERM:
    case EINVAL:
    case ENOSYS:
    case ENOTSUP:
#if EOPNOTSUPP != ENOTSUP
    case EOPNOTSUPP:
#endif
      return true;
    default:
      return false;
  }
}

std::error_code LastError() {
  return std::error_code(errno, std::generic_category());
}

/*
  Exclusive create of the destination, then a copy of the fsync'ed temp file.
  The destination is removed again if anything after the create fails.
*/
void CopyIntoNewFile(const fs::path& temp_path, const fs::path& destination, mode_t permissions) {
  int fd = ::open(destination.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
  if (fd < 0) {
    if (errno == EEXIST) {
      throw util::FilesystemSafetyError("output file already exists: " + destination.string());
    }
    ThrowErrno(errno, "create", destination);
  }
  TempFileGuard partial(destination);

  if (::fchmod(fd, permissions) != 0) {
    const int err = errno;
    ::close(fd);
    ThrowErrno(err, "chmod", destination);
  }
  auto opened = arrow::io::FileOutputStream::Open(fd);
  if (!opened.ok()) {
    ::close(fd);
    Unwrap(opened.status());
  }
  std::shared_ptr<arrow::io::FileOutputStream> out    = *opened;
  std::shared_ptr<arrow::io::ReadableFile>     source = Unwrap(arrow::io::ReadableFile::Open(temp_path.string()));

  for (;;) {
    auto chunk = Unwrap(source->Read(kCopyChunkSize));
    if (chunk->size() == 0) {
      break;
    }
    Unwrap(out->Write(chunk));
  }
  Unwrap(source->Close());
  Unwrap(out->Flush());
  if (::fsync(out->file_descriptor()) != 0) {
    ThrowErrno(errno, "fsync", destination);
  }
  Unwrap(out->Close());
  partial.MarkConsumed();
}

} // namespace

AtomicFileWriter::AtomicFileWriter() : AtomicFileWriter(Options{}) {
}

AtomicFileWriter::AtomicFileWriter(Options options) : options_(std::move(options)) {
}

std::error_code AtomicFileWriter::Rename(const fs::path& from, const fs::path& to) const {
  if (options_.rename) {
    return options_.rename(from, to);
  }
  std::error_code ec;
  fs::rename(from, to, ec);
  return ec;
}

std::error_code AtomicFileWriter::Link(const fs::path& from, const fs::path& to) const {
  if (options_.link) {
    return options_.link(from, to);
  }
  if (::link(from.c_str(), to.c_str()) != 0) {
    return LastError();
  }
  return {};
}

std::error_code AtomicFileWriter::RenameNoReplace(const fs::path& from, const fs::path& to) const {
  if (options_.rename_no_replace) {
    return options_.rename_no_replace(from, to);
  }
  if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) != 0) {
    return LastError();
  }
  return {};
}

/*
  link(2) never replaces an existing entry and never follows a symlink at the
  destination, so a file that appeared since the initial lstat is kept. vfat,
  exFAT and many FUSE/SMB mounts refuse hard links; those fall back to
  renameat2(RENAME_NOREPLACE) and, failing that, to an exclusive create + copy.
*/
bool AtomicFileWriter::PublishNoReplace(const fs::path& temp_path, const fs::path& destination, mode_t permissions) const {
  auto ec = Link(temp_path, destination);
  if (!ec) {
    return false;
  }
  if (ec == std::errc::file_exists) {
    throw util::FilesystemSafetyError("output file already exists: " + destination.string());
  }
  if (!IsUnsupported(ec)) {
    throw std::system_error(ec, "link " + destination.string());
  }

  ec = RenameNoReplace(temp_path, destination);
  if (!ec) {
    return true;
  }
  if (ec == std::errc::file_exists) {
    throw util::FilesystemSafetyError("output file already exists: " + destination.string());
  }
  if (!IsUnsupported(ec)) {
    throw std::system_error(ec, "rename " + temp_path.string() + " to " + destination.string());
  }

  CopyIntoNewFile(temp_path, destination, permissions);
  return false;
}

/*
  Atomic write:
      lstat → temp (same dir) → chmod → write → flush → fsync → close → publish
*/
int64_t AtomicFileWriter::Write(const fs::path& destination, mode_t permissions, bool overwrite, const WriteFn& write) const {
  if (destination.empty()) {
    throw std::invalid_argument("output path is required");
  }

  const auto dir = ParentDirectory(destination);
  MakeDirectories(dir);

  WriteTransaction txn;
  txn.destination_path = destination;

  struct stat st{};
  if (::lstat(destination.c_str(), &st) == 0) {
    if (!overwrite) {
      throw util::FilesystemSafetyError("output file already exists: " + destination.string());
    }
    if (S_ISLNK(st.st_mode)) {
      throw util::FilesystemSafetyError("refusing to overwrite symlink " + Quoted(destination));
    }
    if (S_ISDIR(st.st_mode)) {
      throw util::FilesystemSafetyError("output path " + Quoted(destination) + " is a directory");
    }
    txn.had_existing_file = true;
  } else if (errno != ENOENT) {
    ThrowErrno(errno, "stat", destination);
  }

  auto [temp_path, fd] = CreateTempFile(dir, options_.temp_prefix);
  txn.temporary_path   = temp_path;
  TempFileGuard guard(txn.temporary_path);

  if (::fchmod(fd, permissions) != 0) {
    const int err = errno;
    ::close(fd);
    ThrowErrno(err, "chmod", txn.temporary_path);
  }

  // The stream owns fd from here on and closes it on destruction.
  auto opened = arrow::io::FileOutputStream::Open(fd);
  if (!opened.ok()) {
    ::close(fd);
    Unwrap(opened.status());
  }
  std::shared_ptr<arrow::io::FileOutputStream> stream = *opened;

  const int64_t written = write(*stream);

  Unwrap(stream->Flush());
  if (::fsync(stream->file_descriptor()) != 0) {
    ThrowErrno(errno, "fsync", txn.temporary_path);
  }
  Unwrap(stream->Close());

  if (overwrite) {
    ReplaceDestination(txn.temporary_path, txn.destination_path, txn.had_existing_file);
    guard.MarkConsumed();
    return written;
  }

  if (PublishNoReplace(txn.temporary_path, txn.destination_path, permissions)) {
    guard.MarkConsumed();
  }
  // Otherwise the guard drops the temp name; the content stays reachable at the destination.
  return written;
}

void AtomicFileWriter::ReplaceDestination(const fs::path& temp_path, const fs::path& destination, bool had_existing) const {
  auto ec = Rename(temp_path, destination);
  if (!ec) {
    return;
  }
  if (!had_existing) {
    throw std::system_error(ec, "rename " + temp_path.string() + " to " + destination.string());
  }

  // Backup-swap: the original stays recoverable at every step.
  const auto backup_path = UnusedSiblingPath(ParentDirectory(destination), options_.backup_prefix);

  if (auto move_ec = Rename(destination, backup_path)) {
    throw std::system_error(move_ec, "move existing file " + destination.string() + " aside");
  }
  if (auto move_ec = Rename(temp_path, destination)) {
    if (auto restore_ec = Rename(backup_path, destination)) {
      throw std::system_error(move_ec, "replace " + destination.string() + " (original left at " + backup_path.string() +
                                           ": " + restore_ec.message() + ")");
    }
    throw std::system_error(move_ec, "replace " + destination.string());
  }

  // New content is in place; a leftover backup is only clutter.
  ::unlink(backup_path.c_str());
}

} // namespace assetxfer::storage
