#pragma once

#include <exception>

namespace assetxfer::cli {

enum ExitCode : int {
  kExitOk                     = 0,
  kExitUsage                  = 1,
  kExitFailure                = 2,
  kExitHttpStatus             = 3,
  kExitTransientNetwork       = 4,
  kExitCancelled              = 5,
  kExitFilesystemSafety       = 6,
  kExitRemoteProcessingFailed = 7,
};

// Process exit code for an error that ended a command.
int ToExitCode(const std::exception& e);

} // namespace assetxfer::cli
