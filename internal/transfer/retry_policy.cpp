#include "retry_policy.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace assetxfer::transfer {

void RetryPolicy::Validate() const {
  if (max_attempts < 1) {
    throw std::invalid_argument("retry policy: max_attempts must be at least 1");
  }
  if (initial_delay.count() < 0 || max_delay.count() < 0) {
    throw std::invalid_argument("retry policy: delays must not be negative");
  }
  if (max_delay < initial_delay) {
    throw std::invalid_argument("retry policy: max_delay must not be shorter than initial_delay");
  }
}

util::Millis RetryPolicy::NextDelay(util::Millis current) const {
  return std::min(current * 2, max_delay);
}

bool IsRetryableStatus(int status_code) {
  switch (status_code) {
    case 403:
    case 408:
    case 429:
    case 502:
    case 503:
    case 504:
      return true;
    default:
      return false;
  }
}

bool IsRetryable(const std::exception& error) {
  const auto* transfer_error = dynamic_cast<const util::TransferError*>(&error);
  if (transfer_error == nullptr) {
    return false;
  }

  switch (transfer_error->kind()) {
    case util::ErrorKind::kHttpStatus: {
      const auto* status_error = dynamic_cast<const util::HttpStatusError*>(transfer_error);
      return status_error != nullptr && IsRetryableStatus(status_error->status_code());
    }
    case util::ErrorKind::kTransientNetwork:
      return true;
    case util::ErrorKind::kCancelled:
    case util::ErrorKind::kFilesystemSafety:
    case util::ErrorKind::kRemoteProcessingFailed:
    case util::ErrorKind::kNonRetryable:
      return false;
  }
  return false;
}

} // namespace assetxfer::transfer
