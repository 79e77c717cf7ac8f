#include "cancellation.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace assetxfer::util {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {
}

CancellationToken::CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {
}

CancellationToken CancellationToken::WithTimeout(Millis timeout) const {
  auto child = std::make_shared<State>();

  std::lock_guard lock(state_->mutex);
  child->cancelled = state_->cancelled;
  child->deadline  = Now() + timeout;
  if (state_->deadline) {
    child->deadline = std::min(*child->deadline, *state_->deadline);
  }

  // Drop registrations of children that no longer exist.
  auto& children = state_->children;
  children.erase(std::remove_if(children.begin(), children.end(), [](const std::weak_ptr<State>& c) { return c.expired(); }),
                 children.end());
  children.push_back(child);

  return CancellationToken(std::move(child));
}

void CancellationToken::CancelState(const std::shared_ptr<State>& state) {
  std::vector<std::weak_ptr<State>> children;
  {
    std::lock_guard lock(state->mutex);
    if (state->cancelled) {
      return;
    }
    state->cancelled = true;
    children         = state->children;
  }
  state->cv.notify_all();

  for (const auto& weak_child : children) {
    if (auto child = weak_child.lock()) {
      CancelState(child);
    }
  }
}

void CancellationToken::Cancel() const {
  CancelState(state_);
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled || (state_->deadline && Now() >= *state_->deadline);
}

void CancellationToken::ThrowIfCancelled() const {
  std::lock_guard lock(state_->mutex);
  if (state_->cancelled) {
    throw CancellationError(false);
  }
  if (state_->deadline && Now() >= *state_->deadline) {
    throw CancellationError(true);
  }
}

void CancellationToken::SleepFor(Millis delay) const {
  std::unique_lock lock(state_->mutex);

  auto wake = Now() + delay;
  bool hits_deadline = false;
  if (state_->deadline && *state_->deadline <= wake) {
    wake          = *state_->deadline;
    hits_deadline = true;
  }

  state_->cv.wait_until(lock, wake, [&] { return state_->cancelled; });

  if (state_->cancelled) {
    throw CancellationError(false);
  }
  if (hits_deadline) {
    throw CancellationError(true);
  }
}

std::optional<TimePoint> CancellationToken::deadline() const {
  std::lock_guard lock(state_->mutex);
  return state_->deadline;
}

} // namespace assetxfer::util
