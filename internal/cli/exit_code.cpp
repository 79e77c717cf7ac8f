#include "exit_code.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace assetxfer::cli {

int ToExitCode(const std::exception& e) {
  using namespace assetxfer::util;

  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return kExitUsage;
  }

  const auto* transfer_error = dynamic_cast<const TransferError*>(&e);
  if (transfer_error == nullptr) {
    return kExitFailure;
  }

  switch (transfer_error->kind()) {
    case ErrorKind::kHttpStatus:
      return kExitHttpStatus;
    case ErrorKind::kTransientNetwork:
      return kExitTransientNetwork;
    case ErrorKind::kCancelled:
      return kExitCancelled;
    case ErrorKind::kFilesystemSafety:
      return kExitFilesystemSafety;
    case ErrorKind::kRemoteProcessingFailed:
      return kExitRemoteProcessingFailed;
    case ErrorKind::kNonRetryable:
      return kExitFailure;
  }
  return kExitFailure;
}

} // namespace assetxfer::cli
