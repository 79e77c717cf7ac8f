#pragma once

#include <exception>

#include "internal/util/time.hpp"

namespace assetxfer::transfer {

/*
  Bounded exponential backoff.

  Delay before retry k (1-based) is initial_delay * 2^(k-1), clamped to
  max_delay. max_attempts counts every attempt, the first included.
*/
struct RetryPolicy {
  int          max_attempts  = 4;
  util::Millis initial_delay = util::Millis(200);
  util::Millis max_delay     = util::Millis(2000);

  // Throws std::invalid_argument on an unusable policy.
  void Validate() const;

  // Delay to use after `current`: doubled, clamped to max_delay.
  util::Millis NextDelay(util::Millis current) const;
};

// 403, 408, 429, 502, 503, 504.
bool IsRetryableStatus(int status_code);

/*
  Retry eligibility of a failed attempt, decided from the error kind only.
  Exceptions outside the TransferError taxonomy are terminal.
*/
bool IsRetryable(const std::exception& error);

} // namespace assetxfer::transfer
