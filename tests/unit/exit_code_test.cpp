#include "internal/cli/exit_code.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include "internal/transfer/delivery_state.hpp"
#include "internal/transfer/downloader.hpp"
#include "internal/util/errors.hpp"

namespace {

using assetxfer::cli::ToExitCode;
namespace cli  = assetxfer::cli;
namespace util = assetxfer::util;

void TestTaxonomyMapsToDistinctCodes() {
  assert(ToExitCode(util::HttpStatusError(404, "gone")) == cli::kExitHttpStatus);
  assert(ToExitCode(util::TransientNetworkError("reset")) == cli::kExitTransientNetwork);
  assert(ToExitCode(util::CancellationError(false)) == cli::kExitCancelled);
  assert(ToExitCode(util::CancellationError(true)) == cli::kExitCancelled);
  assert(ToExitCode(util::FilesystemSafetyError("symlink")) == cli::kExitFilesystemSafety);
  assert(ToExitCode(util::RemoteProcessingFailedError("failed")) == cli::kExitRemoteProcessingFailed);
  assert(ToExitCode(util::NonRetryableError("bad url")) == cli::kExitFailure);
}

void TestWrappedErrorsUseTheirKind() {
  const assetxfer::transfer::DownloadError download(util::ErrorKind::kTransientNetwork, "reset", "", 4, 0);
  assert(ToExitCode(download) == cli::kExitTransientNetwork);

  const assetxfer::transfer::DeliveryError delivery(util::ErrorKind::kCancelled, "timed out", "PROCESSING");
  assert(ToExitCode(delivery) == cli::kExitCancelled);
}

void TestOtherErrors() {
  assert(ToExitCode(std::invalid_argument("missing url")) == cli::kExitUsage);
  assert(ToExitCode(std::runtime_error("disk full")) == cli::kExitFailure);
  assert(ToExitCode(std::system_error(std::make_error_code(std::errc::permission_denied))) == cli::kExitFailure);
}

} // namespace

int main() {
  TestTaxonomyMapsToDistinctCodes();
  TestWrappedErrorsUseTheirKind();
  TestOtherErrors();

  std::cout << "assetxfer_unit_exit_code: pass\n";
  return 0;
}
