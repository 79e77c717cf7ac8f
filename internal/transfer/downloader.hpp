#pragma once

#include <sys/types.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <utility>

#include "assetxfer/v1.hpp"
#include "internal/http/http_transport.hpp"
#include "internal/storage/atomic_file_writer.hpp"
#include "internal/transfer/retry_policy.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace assetxfer::transfer {

inline constexpr char        kDefaultUserAgent[]     = "asset-transfer/1.0 (asset-download)";
inline constexpr std::size_t kFailureMessageLimit    = 4096;
inline constexpr mode_t      kDefaultFilePermissions = 0600;

/*
  Terminal download failure.

  kind() is the classified kind of the last attempt's failure. Failures
  outside the transfer taxonomy (local disk I/O) are reported as kNonRetryable.
*/
class DownloadError : public util::TransferError {
 public:
  DownloadError(util::ErrorKind kind, const std::string& msg, std::string content_type, int attempts, int status_code)
      : util::TransferError(kind, msg), content_type_(std::move(content_type)), attempts_(attempts), status_code_(status_code) {
  }

  // Content-Type of the last response seen, empty if none arrived.
  const std::string& content_type() const noexcept {
    return content_type_;
  }

  int attempts() const noexcept {
    return attempts_;
  }

  // HTTP status of the last attempt when it failed with one, otherwise 0.
  int status_code() const noexcept {
    return status_code_;
  }

 private:
  std::string content_type_;
  int         attempts_;
  int         status_code_;
};

/*
  Bounded-retry GET into an AtomicFileWriter.

  Each attempt is a fresh request; a failed attempt leaves nothing at the
  destination, so a retry starts from a clean slate.
*/
class Downloader {
 public:
  // Called before each backoff sleep with the attempt that just failed.
  using RetryObserver = std::function<void(int attempt, util::Millis delay, const std::exception& error)>;

  struct Options {
    RetryPolicy   policy;
    std::string   user_agent  = kDefaultUserAgent;
    mode_t        permissions = kDefaultFilePermissions;
    RetryObserver on_retry;
  };

  Downloader(http::HttpTransportPtr transport, storage::AtomicFileWriter writer, Options options);

  /*
    Throws std::invalid_argument for a blank url or output path and
    DownloadError for every other failure.
  */
  v1::DownloadResult Download(const std::string& url,
                              const std::string& output_path,
                              bool overwrite,
                              const util::CancellationToken& token) const;

 private:
  int64_t DownloadOnce(const std::string& url,
                       const std::string& output_path,
                       bool overwrite,
                       const util::CancellationToken& token,
                       std::string* content_type) const;

  http::HttpTransportPtr    transport_;
  storage::AtomicFileWriter writer_;
  Options                   options_;
};

} // namespace assetxfer::transfer
