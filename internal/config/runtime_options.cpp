#include "runtime_options.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/time.hpp"

namespace assetxfer::config {

namespace cfg = assetxfer::runtime::config;

namespace {

constexpr util::Millis kDefaultPollInterval{2000};
constexpr util::Millis kDefaultUploadTimeout{10 * 60 * 1000};

} // namespace

transfer::RetryPolicy ResolveRetryPolicy(const cfg::DownloadConfig& config) {
  transfer::RetryPolicy policy;
  if (config.max_attempts() != 0) {
    policy.max_attempts = config.max_attempts();
  }
  if (config.has_initial_delay()) {
    policy.initial_delay = util::FromProto(config.initial_delay(), policy.initial_delay);
  }
  if (config.has_max_delay()) {
    policy.max_delay = util::FromProto(config.max_delay(), policy.max_delay);
  }
  policy.Validate();
  return policy;
}

mode_t ResolvePermissions(const cfg::DownloadConfig& config) {
  const auto text = storage::common::TrimSpace(config.permissions());
  if (text.empty()) {
    return transfer::kDefaultFilePermissions;
  }
  if (!std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '7'; })) {
    throw std::invalid_argument("download.permissions must be an octal string, got \"" + text + "\"");
  }
  // Leading zeros are insignificant; anything past three digits cannot fit 0777.
  const auto significant = text.find_first_not_of('0');
  if (significant != std::string::npos && text.size() - significant > 3) {
    throw std::invalid_argument("download.permissions out of range: \"" + text + "\"");
  }
  const auto mode = std::stoul(text, nullptr, 8);
  if (mode > 0777) {
    throw std::invalid_argument("download.permissions out of range: \"" + text + "\"");
  }
  return static_cast<mode_t>(mode);
}

transfer::Downloader::Options ResolveDownloaderOptions(const cfg::DownloadConfig& config) {
  transfer::Downloader::Options options;
  options.policy      = ResolveRetryPolicy(config);
  options.permissions = ResolvePermissions(config);
  if (!storage::common::TrimSpace(config.user_agent()).empty()) {
    options.user_agent = storage::common::TrimSpace(config.user_agent());
  }
  return options;
}

http::CurlTransport::Options ResolveTransportOptions(const cfg::DownloadConfig& config) {
  http::CurlTransport::Options options;
  options.connect_timeout = util::FromProto(config.connect_timeout(), options.connect_timeout);
  if (options.connect_timeout.count() < 0) {
    throw std::invalid_argument("download.connect_timeout must not be negative");
  }
  return options;
}

upload::UploadPipeline::Options ResolveUploadOptions(const cfg::UploadConfig& config) {
  upload::UploadPipeline::Options options;
  options.poll_interval = util::FromProto(config.poll_interval(), kDefaultPollInterval);
  if (options.poll_interval.count() <= 0) {
    throw std::invalid_argument("upload.poll_interval must be greater than zero");
  }

  const auto timeout = util::FromProto(config.timeout(), kDefaultUploadTimeout);
  if (timeout.count() < 0) {
    throw std::invalid_argument("upload.timeout must not be negative");
  }
  options.timeout = timeout;

  switch (config.checksum_algorithm()) {
    case cfg::CHECKSUM_ALGORITHM_SHA256:
      options.checksum_algorithm = upload::ChecksumAlgorithm::kSha256;
      break;
    case cfg::CHECKSUM_ALGORITHM_MD5:
    default:
      options.checksum_algorithm = upload::ChecksumAlgorithm::kMd5;
      break;
  }
  return options;
}

remote::HttpAssetRemote::Options ResolveRemoteOptions(const cfg::RemoteConfig& config) {
  remote::HttpAssetRemote::Options options;
  options.base_url = storage::common::TrimSpace(config.base_url());
  for (const auto& [name, value] : config.headers()) {
    options.headers.emplace_back(name, value);
  }
  // Map iteration order is unspecified; keep requests reproducible.
  std::sort(options.headers.begin(), options.headers.end());

  if (config.has_request_timeout()) {
    const auto timeout = util::FromProto(config.request_timeout(), util::Millis(0));
    if (timeout.count() < 0) {
      throw std::invalid_argument("remote.request_timeout must not be negative");
    }
    if (timeout.count() > 0) {
      options.request_timeout = timeout;
    }
  }
  return options;
}

} // namespace assetxfer::config
