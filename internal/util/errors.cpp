#include "errors.hpp"

#include <utility>

namespace assetxfer::util {

std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kHttpStatus:
      return "http_status";
    case ErrorKind::kTransientNetwork:
      return "transient_network";
    case ErrorKind::kCancelled:
      return "cancelled";
    case ErrorKind::kFilesystemSafety:
      return "filesystem_safety";
    case ErrorKind::kRemoteProcessingFailed:
      return "remote_processing_failed";
    case ErrorKind::kNonRetryable:
      return "non_retryable";
  }
  return "unknown";
}

HttpStatusError::HttpStatusError(int status_code, std::string body_message)
    : TransferError(ErrorKind::kHttpStatus, "unexpected status " + std::to_string(status_code) + " (" + body_message + ")"),
      status_code_(status_code),
      body_message_(std::move(body_message)) {
}

} // namespace assetxfer::util
