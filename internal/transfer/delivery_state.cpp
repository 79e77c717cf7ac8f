#include "delivery_state.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include "internal/transfer/poller.hpp"

namespace assetxfer::transfer {

namespace {

std::string Upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

} // namespace

std::string FormatAssetErrors(const google::protobuf::RepeatedPtrField<v1::AssetErrorDetail>& errors) {
  std::string joined;
  for (const auto& item : errors) {
    std::string part;
    if (!item.code().empty() && !item.message().empty()) {
      part = item.code() + ": " + item.message();
    } else if (!item.message().empty()) {
      part = item.message();
    } else if (!item.code().empty()) {
      part = item.code();
    } else {
      continue;
    }
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += part;
  }
  return joined.empty() ? "unknown error" : joined;
}

std::string WaitForDeliveryState(const std::string& asset_id,
                                 util::Millis interval,
                                 const util::CancellationToken& token,
                                 const DeliveryStateFetcher& fetch) {
  std::string last_state;

  std::function<std::optional<bool>()> check = [&]() -> std::optional<bool> {
    const auto state = fetch();
    last_state       = state.state();

    const auto normalized = Upper(state.state());
    if (normalized == kStateComplete) {
      return true;
    }
    if (normalized == kStateFailed) {
      throw util::RemoteProcessingFailedError("asset " + asset_id + " delivery failed: " + FormatAssetErrors(state.errors()));
    }
    return std::nullopt;
  };

  try {
    PollUntil<bool>(interval, token, check);
  } catch (const util::TransferError& e) {
    if (e.kind() == util::ErrorKind::kCancelled) {
      throw DeliveryError(e.kind(), "timed out waiting for asset " + asset_id + " delivery: " + e.what(), last_state);
    }
    const auto* status_error = dynamic_cast<const util::HttpStatusError*>(&e);
    throw DeliveryError(e.kind(), e.what(), last_state, status_error != nullptr ? status_error->status_code() : 0);
  } catch (const std::runtime_error& e) {
    throw DeliveryError(util::ErrorKind::kNonRetryable, e.what(), last_state);
  }

  return last_state;
}

} // namespace assetxfer::transfer
