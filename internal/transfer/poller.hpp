#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/util/cancellation.hpp"

namespace assetxfer::transfer {

/*
  Calls `check` until it yields a value, sleeping `interval` between calls.

  nullopt means "not done yet"; an exception from `check` ends polling and
  propagates as is. Cancellation (before the first call, between calls, or at
  the deadline) surfaces as CancellationError.
*/
template <typename T>
T PollUntil(util::Millis interval, const util::CancellationToken& token, const std::function<std::optional<T>()>& check) {
  if (interval.count() <= 0) {
    throw std::invalid_argument("poll interval must be greater than zero");
  }

  while (true) {
    token.ThrowIfCancelled();
    if (auto value = check()) {
      return std::move(*value);
    }
    token.SleepFor(interval);
  }
}

} // namespace assetxfer::transfer
