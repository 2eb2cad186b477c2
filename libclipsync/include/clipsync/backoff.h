/**
 * @file backoff.h
 * @brief Exponential backoff with jitter
 */

#ifndef CLIPSYNC_BACKOFF_H
#define CLIPSYNC_BACKOFF_H

#include "platform.h"
#include "types.h"

namespace clipsync {

/**
 * @brief Backoff parameters
 */
struct BackoffPolicy {
  Milliseconds initial{100};
  double multiplier = 1.5;
  Milliseconds max{2000};
  double jitter = 0.2; // Fraction applied as +/- around the base delay
  bool clamp = false;  // Keep jittered delays within [initial, max]

  /// Chunk POST retries: 100 ms x1.5, capped at 2 s, +/-20%
  static BackoffPolicy upload() {
    return {Milliseconds(100), 1.5, Milliseconds(2000), 0.2};
  }

  /// Stream reconnects: 0.5 s doubling to 8 s, +/-20%, never outside 0.5-8 s
  static BackoffPolicy reconnect() {
    return {Milliseconds(500), 2.0, Milliseconds(8000), 0.2, true};
  }
};

/**
 * @brief Delay sequence for one series of attempts
 *
 * Each call to next_delay() returns the current base delay with jitter
 * applied and then advances the base by the multiplier, up to max. The
 * jittered value may exceed max by the jitter fraction unless the policy
 * clamps it to [initial, max].
 */
class CLIPSYNC_API Backoff {
public:
  explicit Backoff(BackoffPolicy policy = BackoffPolicy::upload());

  /// Delay to wait before the next attempt
  Milliseconds next_delay();

  /// Base delay next_delay() will jitter, without advancing
  Milliseconds current() const { return current_; }

  /// Number of delays handed out since the last reset
  int attempts() const { return attempts_; }

  /// Start over from the initial delay
  void reset();

  const BackoffPolicy &policy() const { return policy_; }

private:
  BackoffPolicy policy_;
  Milliseconds current_;
  int attempts_ = 0;
};

} // namespace clipsync

#endif // CLIPSYNC_BACKOFF_H
