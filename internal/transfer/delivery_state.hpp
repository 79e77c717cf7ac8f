#pragma once

#include <functional>
#include <string>

#include "assetxfer/v1.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace assetxfer::transfer {

inline constexpr char kStateComplete[] = "COMPLETE";
inline constexpr char kStateFailed[]   = "FAILED";

// Delivery wait that did not end in COMPLETE.
class DeliveryError : public util::TransferError {
 public:
  DeliveryError(util::ErrorKind kind, const std::string& msg, std::string last_state, int status_code = 0)
      : util::TransferError(kind, msg), last_state_(std::move(last_state)), status_code_(status_code) {
  }

  // Last state the remote reported before the failure, empty if none.
  const std::string& last_state() const noexcept {
    return last_state_;
  }

  // HTTP status of a failed state fetch, 0 otherwise.
  int status_code() const noexcept {
    return status_code_;
  }

 private:
  std::string last_state_;
  int         status_code_;
};

using DeliveryStateFetcher = std::function<v1::AssetDeliveryState()>;

// "code: message" per entry (or whichever part is set), joined with "; ".
std::string FormatAssetErrors(const google::protobuf::RepeatedPtrField<v1::AssetErrorDetail>& errors);

/*
  Polls `fetch` until the asset reaches COMPLETE (case-insensitive) and
  returns the last observed state string.

  FAILED raises DeliveryError(kRemoteProcessingFailed); cancellation or the
  token's deadline raises DeliveryError(kCancelled) with a "timed out" message;
  fetch errors are re-raised as DeliveryError of the same kind, keeping the
  HTTP status of an HttpStatusError. Every other
  state keeps polling.
*/
std::string WaitForDeliveryState(const std::string& asset_id,
                                 util::Millis interval,
                                 const util::CancellationToken& token,
                                 const DeliveryStateFetcher& fetch);

} // namespace assetxfer::transfer
