#include "http_asset_remote.hpp"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>
#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace assetxfer::remote {

namespace {

constexpr std::size_t kFailureMessageLimit = 4096;

std::string StripTrailingSlashes(std::string value) {
  while (!value.empty() && value.back() == '/') {
    value.pop_back();
  }
  return value;
}

} // namespace

std::string EscapePathSegment(const std::string& segment) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string           out;
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

HttpAssetRemote::HttpAssetRemote(http::HttpTransportPtr transport, Options options)
    : transport_(std::move(transport)), options_(std::move(options)) {
  if (!transport_) {
    throw std::invalid_argument("asset remote requires a transport");
  }
  options_.base_url = StripTrailingSlashes(options_.base_url);
  if (options_.base_url.empty()) {
    throw std::invalid_argument("remote base_url is required");
  }
}

std::string HttpAssetRemote::Call(const std::string& method,
                                  const std::string& path,
                                  const google::protobuf::Struct* body,
                                  const util::CancellationToken& token) const {
  http::HttpRequest request;
  request.method  = method;
  request.url     = options_.base_url + path;
  request.headers = options_.headers;
  request.headers.emplace_back("Accept", "application/json");

  if (body != nullptr) {
    std::string json;
    auto        status = google::protobuf::util::MessageToJsonString(*body, &json);
    if (!status.ok()) {
      throw std::runtime_error("encode request for " + request.url + ": " + std::string(status.message()));
    }
    request.headers.emplace_back("Content-Type", "application/json");
    request.body_length = static_cast<int64_t>(json.size());
    request.body        = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(std::move(json)));
  }

  const auto call_token = options_.request_timeout ? token.WithTimeout(*options_.request_timeout) : token;

  auto response = transport_->Send(request, call_token);
  if (!http::IsSuccessStatus(response->status_code())) {
    throw util::HttpStatusError(response->status_code(), http::FailureMessage(*response, kFailureMessageLimit));
  }
  return http::ReadAll(*response);
}

v1::AssetRecord HttpAssetRemote::ParseRecord(const std::string& json, const std::string& what) const {
  v1::AssetRecord                         record;
  google::protobuf::util::JsonParseOptions parse_options;
  parse_options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &record, parse_options);
  if (!status.ok()) {
    throw util::NonRetryableError("decode " + what + " response: " + std::string(status.message()));
  }
  return record;
}

v1::AssetRecord HttpAssetRemote::CreateRecord(const std::string& file_name,
                                              int64_t file_size,
                                              const std::string& mime_type,
                                              const util::CancellationToken& token) {
  google::protobuf::Struct body;
  auto&                    fields = *body.mutable_fields();
  fields["fileName"].set_string_value(file_name);
  fields["fileSize"].set_number_value(static_cast<double>(file_size));
  fields["mimeType"].set_string_value(mime_type);

  auto record = ParseRecord(Call("POST", "/assets", &body, token), "create asset");
  if (record.id().empty()) {
    throw util::NonRetryableError("create asset response has no id");
  }
  return record;
}

void HttpAssetRemote::Commit(const std::string& asset_id, const std::string& checksum, const util::CancellationToken& token) {
  google::protobuf::Struct body;
  auto&                    fields = *body.mutable_fields();
  fields["uploaded"].set_bool_value(true);
  fields["sourceFileChecksum"].set_string_value(checksum);

  Call("PATCH", "/assets/" + EscapePathSegment(asset_id), &body, token);
}

v1::AssetDeliveryState HttpAssetRemote::FetchState(const std::string& asset_id, const util::CancellationToken& token) {
  auto record = ParseRecord(Call("GET", "/assets/" + EscapePathSegment(asset_id), nullptr, token), "asset state");
  return record.asset_delivery_state();
}

} // namespace assetxfer::remote
