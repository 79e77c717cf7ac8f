#include "batch_downloader.hpp"

#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include "internal/storage/common/path_utils.hpp"
#include "internal/transfer/asset_url.hpp"

namespace assetxfer::transfer {

using storage::common::TrimSpace;

std::string ResolveOutputPath(const v1::DownloadManifest& manifest, const v1::DownloadItem& item, int index) {
  const auto explicit_path = TrimSpace(item.output_path());
  if (!explicit_path.empty()) {
    return explicit_path;
  }

  const auto output_dir = TrimSpace(manifest.output_dir());
  if (output_dir.empty()) {
    throw std::invalid_argument("item " + std::to_string(index + 1) + " has no output_path and the manifest has no output_dir");
  }

  const auto id   = TrimSpace(item.id());
  auto       base = storage::common::SanitizeBaseFileName(item.file_name());
  if (base.empty()) {
    base = id;
  }
  if (base.empty()) {
    base = "asset-" + std::to_string(index + 1);
  }

  char prefix[16];
  std::snprintf(prefix, sizeof(prefix), "%02d", index + 1);
  return (std::filesystem::path(output_dir) / (std::string(prefix) + "_" + id + "_" + base)).string();
}

std::string ResolveItemUrl(const v1::DownloadItem& item) {
  const auto url = TrimSpace(item.url());
  if (!url.empty()) {
    return url;
  }
  if (!item.has_image_asset()) {
    throw std::invalid_argument("image asset is missing");
  }
  const auto& asset = item.image_asset();
  return ResolveImageAssetDownloadUrl(asset.template_url(), asset.width(), asset.height(), item.file_name());
}

BatchDownloader::BatchDownloader(const Downloader& downloader) : downloader_(downloader) {
}

v1::BatchDownloadResult BatchDownloader::DownloadAll(const v1::DownloadManifest& manifest,
                                                     bool overwrite,
                                                     const util::CancellationToken& token) const {
  v1::BatchDownloadResult result;
  result.set_total(manifest.items_size());

  for (int i = 0; i < manifest.items_size(); ++i) {
    const auto& item = manifest.items(i);
    token.ThrowIfCancelled();

    std::string url;
    std::string output_path;
    auto        record_failure = [&](const std::exception& e) {
      auto* failure = result.add_failures();
      failure->set_id(TrimSpace(item.id()));
      failure->set_url(url);
      failure->set_output_path(output_path);
      failure->set_error(e.what());
    };

    try {
      output_path = ResolveOutputPath(manifest, item, i);
      url         = ResolveItemUrl(item);

      auto downloaded = downloader_.Download(url, output_path, overwrite, token);
      downloaded.set_id(TrimSpace(item.id()));
      *result.add_items() = std::move(downloaded);
    } catch (const util::TransferError& e) {
      if (e.kind() == util::ErrorKind::kCancelled) {
        throw;
      }
      record_failure(e);
    } catch (const std::invalid_argument& e) {
      record_failure(e);
    }
  }

  result.set_downloaded(result.items_size());
  result.set_failed(result.failures_size());
  return result;
}

} // namespace assetxfer::transfer
