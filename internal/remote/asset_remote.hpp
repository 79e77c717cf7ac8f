#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "assetxfer/v1.hpp"
#include "internal/util/cancellation.hpp"

namespace assetxfer::remote {

/*
  Remote side of an upload: reserves an asset record, accepts the commit and
  reports asynchronous processing state.

  Implementations throw the transfer error taxonomy (HttpStatusError,
  TransientNetworkError, CancellationError, ...) and never retry internally.
*/
class AssetRemote {
 public:
  virtual ~AssetRemote() = default;

  virtual v1::AssetRecord CreateRecord(const std::string& file_name,
                                       int64_t file_size,
                                       const std::string& mime_type,
                                       const util::CancellationToken& token) = 0;

  // Marks the asset as uploaded with the checksum of the source file.
  virtual void Commit(const std::string& asset_id, const std::string& checksum, const util::CancellationToken& token) = 0;

  virtual v1::AssetDeliveryState FetchState(const std::string& asset_id, const util::CancellationToken& token) = 0;
};

using AssetRemotePtr = std::shared_ptr<AssetRemote>;

} // namespace assetxfer::remote
