#include "upload_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/transfer/delivery_state.hpp"
#include "internal/upload/asset_files.hpp"
#include "internal/util/errors.hpp"

namespace assetxfer::upload {

using storage::common::Unwrap;

namespace {

constexpr std::size_t kFailureMessageLimit = 4096;

bool IsContentLength(const std::string& name) {
  static constexpr char kName[] = "content-length";
  if (name.size() != sizeof(kName) - 1) {
    return false;
  }
  return std::equal(name.begin(), name.end(), kName,
                    [](char a, char b) { return std::tolower(static_cast<unsigned char>(a)) == b; });
}

} // namespace

UploadPipeline::UploadPipeline(remote::AssetRemotePtr remote, http::HttpTransportPtr transport, Options options)
    : remote_(std::move(remote)), transport_(std::move(transport)), options_(options) {
  if (!remote_ || !transport_) {
    throw std::invalid_argument("upload pipeline requires a remote and a transport");
  }
  if (options_.poll_interval.count() <= 0) {
    throw std::invalid_argument("poll interval must be greater than zero");
  }
}

util::CancellationToken UploadPipeline::ScopeTimeout(const util::CancellationToken& parent_token) const {
  return options_.timeout ? parent_token.WithTimeout(*options_.timeout) : parent_token;
}

v1::AssetUploadResult UploadPipeline::Upload(const std::filesystem::path& path, const util::CancellationToken& token) const {
  return UploadOne(path, ScopeTimeout(token));
}

v1::AssetUploadResult UploadPipeline::UploadOne(const std::filesystem::path& path, const util::CancellationToken& token) const {
  const auto asset = ValidateAssetFile(path);
  auto       file  = OpenExistingNoFollow(asset.path);

  // The open handle is authoritative; the file may have changed since validation.
  const auto size = Unwrap(file->GetSize());
  if (size <= 0) {
    throw std::invalid_argument("file is empty: \"" + asset.path.string() + "\"");
  }

  auto       whole    = Unwrap(arrow::io::RandomAccessFile::GetStream(file, 0, size));
  const auto checksum = ComputeChecksum(*whole, options_.checksum_algorithm);

  token.ThrowIfCancelled();
  const auto record = remote_->CreateRecord(asset.file_name, size, asset.mime_type, token);
  if (record.upload_operations_size() == 0) {
    throw util::NonRetryableError("no upload operations returned for asset " + record.id());
  }

  for (const auto& operation : record.upload_operations()) {
    ExecuteOperation(operation, file, size, token);
  }

  remote_->Commit(record.id(), checksum.hash, token);

  const auto state = transfer::WaitForDeliveryState(record.id(), options_.poll_interval, token,
                                                    [&] { return remote_->FetchState(record.id(), token); });

  v1::AssetUploadResult result;
  result.set_file_name(asset.file_name);
  result.set_file_path(asset.path.string());
  result.set_asset_id(record.id());
  result.set_state(state);
  return result;
}

void UploadPipeline::ExecuteOperation(const v1::UploadOperation& operation,
                                      const std::shared_ptr<arrow::io::ReadableFile>& file,
                                      int64_t file_size,
                                      const util::CancellationToken& token) const {
  if (storage::common::TrimSpace(operation.url()).empty()) {
    throw util::NonRetryableError("upload operation has no URL");
  }
  if (operation.offset() < 0 || operation.length() <= 0 || operation.offset() > file_size ||
      operation.length() > file_size - operation.offset()) {
    throw util::NonRetryableError("upload operation range [" + std::to_string(operation.offset()) + ", +" +
                                  std::to_string(operation.length()) + ") exceeds file size " + std::to_string(file_size));
  }

  http::HttpRequest request;
  request.method = operation.method().empty() ? "PUT" : operation.method();
  request.url    = storage::common::TrimSpace(operation.url());
  for (const auto& header : operation.request_headers()) {
    if (!IsContentLength(header.name())) {
      request.headers.emplace_back(header.name(), header.value());
    }
  }
  request.body        = Unwrap(arrow::io::RandomAccessFile::GetStream(file, operation.offset(), operation.length()));
  request.body_length = operation.length();

  auto response = transport_->Send(request, token);
  if (!http::IsSuccessStatus(response->status_code())) {
    throw util::HttpStatusError(response->status_code(), http::FailureMessage(*response, kFailureMessageLimit));
  }
}

v1::AssetUploadBatchResult UploadPipeline::UploadAll(const std::vector<std::filesystem::path>& files,
                                                     const util::CancellationToken& parent_token) const {
  // One deadline for the whole batch.
  const auto                 token = ScopeTimeout(parent_token);
  v1::AssetUploadBatchResult batch;
  for (const auto& file : files) {
    *batch.add_results() = UploadOne(file, token);
  }
  return batch;
}

} // namespace assetxfer::upload
