#pragma once

#include "assetxfer/v1.hpp"
#include "internal/transfer/downloader.hpp"
#include "internal/util/cancellation.hpp"

namespace assetxfer::transfer {

/*
  Sequential download of a manifest.

  A failing item (URL resolution or download) is recorded and the batch moves
  on; only cancellation stops it early.
*/
class BatchDownloader {
 public:
  explicit BatchDownloader(const Downloader& downloader);

  v1::BatchDownloadResult DownloadAll(const v1::DownloadManifest& manifest, bool overwrite, const util::CancellationToken& token) const;

 private:
  const Downloader& downloader_;
};

// Destination of the item at `index` (0-based) in `manifest`.
std::string ResolveOutputPath(const v1::DownloadManifest& manifest, const v1::DownloadItem& item, int index);

// The item's direct URL, or the resolved image asset template.
std::string ResolveItemUrl(const v1::DownloadItem& item);

} // namespace assetxfer::transfer
