#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>

#include "internal/http/http_transport.hpp"
#include "internal/remote/asset_remote.hpp"

namespace assetxfer::remote {

/*
  JSON-over-HTTP AssetRemote.

    POST  {base}/assets       {"fileName","fileSize","mimeType"}  -> AssetRecord
    PATCH {base}/assets/{id}  {"uploaded":true,"sourceFileChecksum"}
    GET   {base}/assets/{id}                                      -> AssetRecord

  Response fields the records do not know are ignored.
*/
class HttpAssetRemote final : public AssetRemote {
 public:
  struct Options {
    std::string                 base_url;
    http::Headers               headers;
    std::optional<util::Millis> request_timeout;
  };

  HttpAssetRemote(http::HttpTransportPtr transport, Options options);

  v1::AssetRecord CreateRecord(const std::string& file_name,
                               int64_t file_size,
                               const std::string& mime_type,
                               const util::CancellationToken& token) override;

  void Commit(const std::string& asset_id, const std::string& checksum, const util::CancellationToken& token) override;

  v1::AssetDeliveryState FetchState(const std::string& asset_id, const util::CancellationToken& token) override;

 private:
  // Sends `method` to `path` and returns the 2xx response body.
  std::string Call(const std::string& method,
                   const std::string& path,
                   const google::protobuf::Struct* body,
                   const util::CancellationToken& token) const;

  v1::AssetRecord ParseRecord(const std::string& json, const std::string& what) const;

  http::HttpTransportPtr transport_;
  Options                options_;
};

// Percent-encodes everything outside RFC 3986 unreserved characters.
std::string EscapePathSegment(const std::string& segment);

} // namespace assetxfer::remote
