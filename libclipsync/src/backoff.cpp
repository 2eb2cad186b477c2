/**
 * @file backoff.cpp
 * @brief Exponential backoff implementation
 */

#include "clipsync/backoff.h"
#include "clipsync/security.h"
#include <algorithm>

namespace clipsync {

Backoff::Backoff(BackoffPolicy policy)
    : policy_(policy), current_(policy.initial) {}

Milliseconds Backoff::next_delay() {
  double base = static_cast<double>(current_.count());
  double factor = 1.0;
  if (policy_.jitter > 0.0) {
    factor = (1.0 - policy_.jitter) + 2.0 * policy_.jitter * random_unit();
  }
  auto delay = Milliseconds(static_cast<Milliseconds::rep>(base * factor));
  if (policy_.clamp) {
    delay = std::max(policy_.initial, std::min(delay, policy_.max));
  }

  auto grown = Milliseconds(
      static_cast<Milliseconds::rep>(base * policy_.multiplier));
  current_ = std::min(grown, policy_.max);
  ++attempts_;

  return delay;
}

void Backoff::reset() {
  current_ = policy_.initial;
  attempts_ = 0;
}

} // namespace clipsync
