#include "internal/remote/http_asset_remote.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "test_support.hpp"

namespace {

using assetxfer::remote::EscapePathSegment;
using assetxfer::remote::HttpAssetRemote;
using assetxfer::testing::ScriptedTransport;
using assetxfer::testing::Throws;
using assetxfer::util::CancellationToken;
namespace util = assetxfer::util;

google::protobuf::Struct ParseBody(const std::string& json) {
  google::protobuf::Struct body;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &body);
  assert(status.ok());
  return body;
}

HttpAssetRemote MakeRemote(const std::shared_ptr<ScriptedTransport>& transport) {
  HttpAssetRemote::Options options;
  options.base_url = "https://api.example.com/v1/";
  options.headers  = {{"Authorization", "Bearer token-1"}};
  return HttpAssetRemote(transport, options);
}

void TestCreateRecord() {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->Respond(201, R"({
    "id": "asset-1",
    "uploadOperations": [
      {"method": "PUT", "url": "https://upload.example.com/p1", "offset": 0, "length": "4",
       "requestHeaders": [{"name": "Content-Type", "value": "image/png"}]},
      {"url": "https://upload.example.com/p2", "offset": "4", "length": 6}
    ],
    "assetDeliveryState": {"state": "AWAITING_UPLOAD"},
    "createdDate": "2024-01-01T00:00:00Z"
  })");

  auto       remote = MakeRemote(transport);
  const auto record = remote.CreateRecord("photo.png", 10, "image/png", CancellationToken());

  assert(record.id() == "asset-1");
  assert(record.upload_operations_size() == 2);
  assert(record.upload_operations(0).method() == "PUT");
  assert(record.upload_operations(0).length() == 4);
  assert(record.upload_operations(0).request_headers(0).value() == "image/png");
  assert(record.upload_operations(1).method().empty());
  assert(record.upload_operations(1).offset() == 4);
  assert(record.asset_delivery_state().state() == "AWAITING_UPLOAD");

  const auto requests = transport->requests();
  assert(requests.size() == 1);
  assert(requests[0].method == "POST");
  assert(requests[0].url == "https://api.example.com/v1/assets");
  assert(requests[0].Header("Authorization") == "Bearer token-1");
  assert(requests[0].Header("Content-Type") == "application/json");
  assert(requests[0].Header("Accept") == "application/json");

  const auto body = ParseBody(requests[0].body);
  assert(body.fields().at("fileName").string_value() == "photo.png");
  assert(body.fields().at("fileSize").kind_case() == google::protobuf::Value::kNumberValue);
  assert(body.fields().at("fileSize").number_value() == 10);
  assert(body.fields().at("mimeType").string_value() == "image/png");
}

void TestCreateRecordWithoutIdIsRejected() {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->Respond(200, R"({"uploadOperations": []})");

  auto remote = MakeRemote(transport);
  assert(Throws<util::NonRetryableError>([&] { remote.CreateRecord("a.png", 1, "image/png", CancellationToken()); }));
}

void TestMalformedJsonIsNonRetryable() {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->Respond(200, "<html>not json</html>");

  auto remote = MakeRemote(transport);
  assert(Throws<util::NonRetryableError>([&] { remote.FetchState("a", CancellationToken()); }));
}

void TestCommit() {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->Respond(204, "");

  auto remote = MakeRemote(transport);
  remote.Commit("folder/asset 1", "781e5e245d69b566979b86e28d23f2c7", CancellationToken());

  const auto requests = transport->requests();
  assert(requests.size() == 1);
  assert(requests[0].method == "PATCH");
  assert(requests[0].url == "https://api.example.com/v1/assets/folder%2Fasset%201");

  const auto body = ParseBody(requests[0].body);
  assert(body.fields().at("uploaded").bool_value());
  assert(body.fields().at("sourceFileChecksum").string_value() == "781e5e245d69b566979b86e28d23f2c7");
}

void TestFetchState() {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->Respond(200, R"({
    "id": "asset-1",
    "assetDeliveryState": {
      "state": "FAILED",
      "errors": [{"code": "400", "message": "bad"}],
      "warnings": [{"message": "slow"}],
      "progress": 0.5
    }
  })");

  auto       remote = MakeRemote(transport);
  const auto state  = remote.FetchState("asset-1", CancellationToken());
  assert(state.state() == "FAILED");
  assert(state.errors_size() == 1);
  assert(state.errors(0).code() == "400");
  assert(state.warnings(0).message() == "slow");

  const auto requests = transport->requests();
  assert(requests[0].method == "GET");
  assert(requests[0].url == "https://api.example.com/v1/assets/asset-1");
  assert(requests[0].body.empty());
  assert(!requests[0].HasHeader("Content-Type"));
}

void TestErrorStatus() {
  auto transport = std::make_shared<ScriptedTransport>();
  transport->Respond(503, "  maintenance \n window ");

  auto remote = MakeRemote(transport);
  try {
    remote.FetchState("a", CancellationToken());
    assert(false && "expected HttpStatusError");
  } catch (const util::HttpStatusError& e) {
    assert(e.status_code() == 503);
    assert(e.body_message() == "maintenance window");
  }
}

void TestEscapePathSegment() {
  assert(EscapePathSegment("Abc-1.2_3~") == "Abc-1.2_3~");
  assert(EscapePathSegment("a b/c") == "a%20b%2Fc");
  assert(EscapePathSegment("\xC3\xBC") == "%C3%BC");
  assert(EscapePathSegment("..").size() == 2);
}

void TestRequiresBaseUrl() {
  auto transport = std::make_shared<ScriptedTransport>();
  assert(Throws<std::invalid_argument>([&] { HttpAssetRemote remote(transport, HttpAssetRemote::Options{}); }));

  HttpAssetRemote::Options only_slash;
  only_slash.base_url = "///";
  assert(Throws<std::invalid_argument>([&] { HttpAssetRemote remote(transport, only_slash); }));
}

} // namespace

int main() {
  TestCreateRecord();
  TestCreateRecordWithoutIdIsRejected();
  TestMalformedJsonIsNonRetryable();
  TestCommit();
  TestFetchState();
  TestErrorStatus();
  TestEscapePathSegment();
  TestRequiresBaseUrl();

  std::cout << "assetxfer_unit_http_asset_remote: pass\n";
  return 0;
}
