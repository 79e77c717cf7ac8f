#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace assetxfer::util {

/*
  Central error taxonomy.

  Every failure the transfer core raises is a TransferError tagged with one
  ErrorKind. Retry eligibility and CLI exit codes are decided from the kind,
  never from message text.
*/

enum class ErrorKind {
  kHttpStatus,
  kTransientNetwork,
  kCancelled,
  kFilesystemSafety,
  kRemoteProcessingFailed,
  kNonRetryable,
};

std::string_view ToString(ErrorKind kind);

class TransferError : public std::runtime_error {
 public:
  TransferError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Remote rejected the request with a non-2xx status.
class HttpStatusError : public TransferError {
 public:
  HttpStatusError(int status_code, std::string body_message);

  int status_code() const noexcept {
    return status_code_;
  }

  const std::string& body_message() const noexcept {
    return body_message_;
  }

 private:
  int         status_code_;
  std::string body_message_;
};

// Connection reset, DNS failure, transport timeout, truncated body.
class TransientNetworkError : public TransferError {
 public:
  explicit TransientNetworkError(const std::string& msg) : TransferError(ErrorKind::kTransientNetwork, msg) {
  }
};

class CancellationError : public TransferError {
 public:
  explicit CancellationError(bool deadline_exceeded)
      : TransferError(ErrorKind::kCancelled, deadline_exceeded ? "deadline exceeded" : "operation cancelled"),
        deadline_exceeded_(deadline_exceeded) {
  }

  bool deadline_exceeded() const noexcept {
    return deadline_exceeded_;
  }

 private:
  bool deadline_exceeded_;
};

// Symlink destination, directory destination, destination already exists.
class FilesystemSafetyError : public TransferError {
 public:
  explicit FilesystemSafetyError(const std::string& msg) : TransferError(ErrorKind::kFilesystemSafety, msg) {
  }
};

class RemoteProcessingFailedError : public TransferError {
 public:
  explicit RemoteProcessingFailedError(const std::string& msg) : TransferError(ErrorKind::kRemoteProcessingFailed, msg) {
  }
};

class NonRetryableError : public TransferError {
 public:
  explicit NonRetryableError(const std::string& msg) : TransferError(ErrorKind::kNonRetryable, msg) {
  }
};

} // namespace assetxfer::util
