#pragma once

#include <arrow/io/file.h>

#include <filesystem>
#include <optional>
#include <vector>

#include "assetxfer/v1.hpp"
#include "internal/http/http_transport.hpp"
#include "internal/remote/asset_remote.hpp"
#include "internal/upload/checksum.hpp"
#include "internal/util/cancellation.hpp"

namespace assetxfer::upload {

/*
  validate → open (no symlink) → checksum → create record → upload byte
  ranges → commit → wait for delivery

  Any failure before the commit leaves the remote record uncommitted; the
  pipeline never commits a partially uploaded asset.
*/
class UploadPipeline {
 public:
  struct Options {
    util::Millis                poll_interval{2000};
    std::optional<util::Millis> timeout = util::Millis(10 * 60 * 1000);
    ChecksumAlgorithm           checksum_algorithm = ChecksumAlgorithm::kMd5;
  };

  UploadPipeline(remote::AssetRemotePtr remote, http::HttpTransportPtr transport, Options options);

  // `Options::timeout` bounds this one file.
  v1::AssetUploadResult Upload(const std::filesystem::path& file, const util::CancellationToken& token) const;

  // Uploads in order and stops at the first failure. `Options::timeout` bounds
  // the whole batch, not each file.
  v1::AssetUploadBatchResult UploadAll(const std::vector<std::filesystem::path>& files, const util::CancellationToken& token) const;

 private:
  util::CancellationToken ScopeTimeout(const util::CancellationToken& parent_token) const;

  v1::AssetUploadResult UploadOne(const std::filesystem::path& file, const util::CancellationToken& token) const;

  void ExecuteOperation(const v1::UploadOperation& operation,
                        const std::shared_ptr<arrow::io::ReadableFile>& file,
                        int64_t file_size,
                        const util::CancellationToken& token) const;

  remote::AssetRemotePtr remote_;
  http::HttpTransportPtr transport_;
  Options                options_;
};

} // namespace assetxfer::upload
