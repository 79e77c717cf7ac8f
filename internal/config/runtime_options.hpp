#pragma once

#include <sys/types.h>

#include "config/config.pb.h"
#include "internal/http/curl_transport.hpp"
#include "internal/remote/http_asset_remote.hpp"
#include "internal/transfer/downloader.hpp"
#include "internal/upload/upload_pipeline.hpp"

namespace assetxfer::config {

/*
  Config sections → component options.

  Unset fields take the built-in defaults; every result is validated, so a
  bad value fails at startup rather than mid-transfer.
*/

transfer::RetryPolicy ResolveRetryPolicy(const assetxfer::runtime::config::DownloadConfig& config);

// Octal string such as "0600"; defaults to 0600.
mode_t ResolvePermissions(const assetxfer::runtime::config::DownloadConfig& config);

transfer::Downloader::Options ResolveDownloaderOptions(const assetxfer::runtime::config::DownloadConfig& config);

http::CurlTransport::Options ResolveTransportOptions(const assetxfer::runtime::config::DownloadConfig& config);

upload::UploadPipeline::Options ResolveUploadOptions(const assetxfer::runtime::config::UploadConfig& config);

remote::HttpAssetRemote::Options ResolveRemoteOptions(const assetxfer::runtime::config::RemoteConfig& config);

} // namespace assetxfer::config
