#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/util/time.hpp"

namespace assetxfer::util {

/*
  Cooperative cancellation with an optional deadline.

  A token is a cheap copyable handle onto shared state. Tokens derived with
  WithTimeout() observe their parent's cancellation and their own deadline
  (never later than the parent's). Every blocking point in the transfer core
  (network pump, retry backoff, poll interval) goes through one of these.

  Cancel() is thread-safe but not async-signal-safe: signal handlers should
  flip a flag that another thread turns into Cancel().
*/
class CancellationToken {
 public:
  CancellationToken();

  // Child token cancelled with this one, expiring after `timeout`.
  CancellationToken WithTimeout(Millis timeout) const;

  void Cancel() const;

  // True once Cancel() was called on this token or a parent, or the deadline passed.
  bool IsCancelled() const;

  // Throws CancellationError if cancelled or past the deadline.
  void ThrowIfCancelled() const;

  /*
    Wait `delay`, waking early on cancellation.

    Throws CancellationError when cancelled before or during the wait, or when
    the deadline falls inside the wait (the wait ends at the deadline).
  */
  void SleepFor(Millis delay) const;

  std::optional<TimePoint> deadline() const;

 private:
  struct State {
    std::mutex                       mutex;
    std::condition_variable          cv;
    bool                             cancelled = false;
    std::optional<TimePoint>         deadline;
    std::vector<std::weak_ptr<State>> children;
  };

  explicit CancellationToken(std::shared_ptr<State> state);

  static void CancelState(const std::shared_ptr<State>& state);

  std::shared_ptr<State> state_;
};

} // namespace assetxfer::util
