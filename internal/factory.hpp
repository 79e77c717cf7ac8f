#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/http/http_transport.hpp"
#include "internal/remote/asset_remote.hpp"
#include "internal/transfer/batch_downloader.hpp"
#include "internal/transfer/downloader.hpp"
#include "internal/upload/upload_pipeline.hpp"

namespace assetxfer::factory {

/*
  Application

  Owns the long-lived components of one assetctl run.
  upload_pipeline is null when no remote is configured.
*/
struct Application {
  http::HttpTransportPtr                     transport;
  std::shared_ptr<transfer::Downloader>      downloader;
  std::shared_ptr<transfer::BatchDownloader> batch_downloader;
  remote::AssetRemotePtr                     remote;
  std::shared_ptr<upload::UploadPipeline>    upload_pipeline;
};

/*
  Build

  Composition root: the only place that knows the concrete transport and
  remote types. Retries are logged here, through the downloader's observer.
*/
Application Build(const assetxfer::runtime::config::RuntimeConfig& config);

/*
  Same graph over caller-provided collaborators; tests pass fakes.
*/
Application Build(const assetxfer::runtime::config::RuntimeConfig& config,
                  http::HttpTransportPtr transport,
                  remote::AssetRemotePtr remote);

} // namespace assetxfer::factory
