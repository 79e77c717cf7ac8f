#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/config/runtime_options.hpp"
#include "internal/http/curl_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/http_asset_remote.hpp"
#include "internal/storage/atomic_file_writer.hpp"

namespace assetxfer::factory {

namespace {

void LogRetry(int attempt, util::Millis delay, const std::exception& error) {
  ASSETXFER_LOG_WARN("download attempt failed, retrying", {observability::IntField("attempt", attempt),
                                                           observability::IntField("delay_ms", delay.count()),
                                                           observability::StringField("error", error.what())});
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const assetxfer::runtime::config::RuntimeConfig& config,
                  http::HttpTransportPtr transport,
                  remote::AssetRemotePtr remote) {
  Application app;
  app.transport = std::move(transport);
  app.remote    = std::move(remote);

  // ------------------------------------------------------------------
  // Download path
  // ------------------------------------------------------------------
  auto downloader_options     = config::ResolveDownloaderOptions(config.download());
  downloader_options.on_retry = LogRetry;

  app.downloader       = std::make_shared<transfer::Downloader>(app.transport, storage::AtomicFileWriter(), std::move(downloader_options));
  app.batch_downloader = std::make_shared<transfer::BatchDownloader>(*app.downloader);

  // ------------------------------------------------------------------
  // Upload path
  // ------------------------------------------------------------------
  if (app.remote) {
    app.upload_pipeline =
        std::make_shared<upload::UploadPipeline>(app.remote, app.transport, config::ResolveUploadOptions(config.upload()));
  }

  return app;
}

Application Build(const assetxfer::runtime::config::RuntimeConfig& config) {
  auto transport = std::make_shared<http::CurlTransport>(config::ResolveTransportOptions(config.download()));

  remote::AssetRemotePtr remote;
  if (!config.remote().base_url().empty()) {
    remote = std::make_shared<remote::HttpAssetRemote>(transport, config::ResolveRemoteOptions(config.remote()));
  } else {
    ASSETXFER_LOG_DEBUG("no remote configured, uploads disabled");
  }

  return Build(config, std::move(transport), std::move(remote));
}

} // namespace assetxfer::factory
