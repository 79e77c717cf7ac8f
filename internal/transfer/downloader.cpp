#include "downloader.hpp"

#include <stdexcept>
#include <utility>

#include "internal/storage/common/path_utils.hpp"

namespace assetxfer::transfer {

namespace {

[[noreturn]] void ThrowDownloadError(const std::exception& error, const std::string& content_type, int attempts) {
  auto kind        = util::ErrorKind::kNonRetryable;
  int  status_code = 0;
  if (const auto* transfer_error = dynamic_cast<const util::TransferError*>(&error)) {
    kind = transfer_error->kind();
  }
  if (const auto* status_error = dynamic_cast<const util::HttpStatusError*>(&error)) {
    status_code = status_error->status_code();
  }
  throw DownloadError(kind, error.what(), content_type, attempts, status_code);
}

} // namespace

Downloader::Downloader(http::HttpTransportPtr transport, storage::AtomicFileWriter writer, Options options)
    : transport_(std::move(transport)), writer_(std::move(writer)), options_(std::move(options)) {
  if (!transport_) {
    throw std::invalid_argument("downloader requires a transport");
  }
  options_.policy.Validate();
}

v1::DownloadResult Downloader::Download(const std::string& url,
                                        const std::string& output_path,
                                        bool overwrite,
                                        const util::CancellationToken& token) const {
  const auto trimmed_url = storage::common::TrimSpace(url);
  if (trimmed_url.empty()) {
    throw std::invalid_argument("download URL is required");
  }
  const auto trimmed_path = storage::common::TrimSpace(output_path);
  if (trimmed_path.empty()) {
    throw std::invalid_argument("output path is required");
  }

  const auto& policy = options_.policy;
  auto        delay  = policy.initial_delay;
  std::string content_type;

  for (int attempt = 1;; ++attempt) {
    try {
      const auto written = DownloadOnce(trimmed_url, trimmed_path, overwrite, token, &content_type);

      v1::DownloadResult result;
      result.set_url(trimmed_url);
      result.set_output_path(trimmed_path);
      result.set_bytes_written(written);
      result.set_content_type(content_type);
      result.set_attempts(attempt);
      return result;
    } catch (const std::exception& e) {
      if (!IsRetryable(e) || attempt >= policy.max_attempts) {
        ThrowDownloadError(e, content_type, attempt);
      }
      if (options_.on_retry) {
        options_.on_retry(attempt, delay, e);
      }
    }

    // Cancellation during the backoff replaces the previous attempt's error.
    try {
      token.SleepFor(delay);
    } catch (const util::CancellationError& e) {
      ThrowDownloadError(e, content_type, attempt);
    }
    delay = policy.NextDelay(delay);
  }
}

int64_t Downloader::DownloadOnce(const std::string& url,
                                 const std::string& output_path,
                                 bool overwrite,
                                 const util::CancellationToken& token,
                                 std::string* content_type) const {
  http::HttpRequest request;
  request.method  = "GET";
  request.url     = url;
  request.headers = {{"Accept", "*/*"}, {"User-Agent", options_.user_agent}};

  auto response = transport_->Send(request, token);
  *content_type = storage::common::TrimSpace(response->Header("Content-Type"));

  if (!http::IsSuccessStatus(response->status_code())) {
    throw util::HttpStatusError(response->status_code(), http::FailureMessage(*response, kFailureMessageLimit));
  }

  return writer_.Write(output_path, options_.permissions, overwrite,
                       [&](arrow::io::OutputStream& out) { return http::CopyBody(*response, out); });
}

} // namespace assetxfer::transfer
