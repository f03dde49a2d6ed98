#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <thread>

namespace steward::common {

using sleeper_t = std::function<void(std::chrono::milliseconds)>;

/// Fixed-backoff retry budget shared by every bounded wait.
struct retry_policy_t final {
  uint32_t attempts{1};
  std::chrono::milliseconds interval{0};
  /// Wall-clock bound; no attempt starts after it has passed.
  std::optional<std::chrono::steady_clock::time_point> deadline;
};

inline sleeper_t thread_sleeper() {
  return [](const std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
  };
}

/// Convert a total timeout into an attempt budget (never less than one)
/// bounded by a deadline `timeout` from now.
inline retry_policy_t policy_for_timeout(
    const std::chrono::milliseconds timeout,
    const std::chrono::milliseconds interval) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  if (interval.count() <= 0) {
    return retry_policy_t{
        .attempts = 1, .interval = interval, .deadline = deadline};
  }
  auto attempts = static_cast<uint32_t>(timeout / interval);
  return retry_policy_t{.attempts = attempts == 0 ? 1u : attempts,
                        .interval = interval,
                        .deadline = deadline};
}

/// Time left before `policy.deadline`, clamped at zero; `fallback` when the
/// policy has no deadline.
inline std::chrono::milliseconds remaining(
    const retry_policy_t& policy,
    const std::chrono::milliseconds fallback) {
  if (!policy.deadline) {
    return fallback;
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *policy.deadline - std::chrono::steady_clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

/// Evaluate `predicate` until it holds or the budget is spent.
///
/// Sleeps `policy.interval` between attempts, never after the last one, and
/// never past the deadline. Returns whether the predicate was eventually
/// satisfied.
template <typename Predicate>
bool poll_until(const std::string_view what,
                const retry_policy_t& policy,
                Predicate&& predicate,
                const sleeper_t& sleeper) {
  for (auto attempt = uint32_t{1}; attempt <= policy.attempts; ++attempt) {
    if (predicate()) {
      spdlog::debug("{} satisfied on attempt {}/{}", what, attempt,
                    policy.attempts);
      return true;
    }
    if (attempt < policy.attempts) {
      auto delay = policy.interval;
      if (policy.deadline) {
        auto left = remaining(policy, policy.interval);
        if (left.count() == 0) {
          spdlog::warn("{} not satisfied before its deadline ({} attempt(s))",
                       what, attempt);
          return false;
        }
        delay = std::min(delay, left);
      }
      spdlog::info("Waiting for {} (attempt {}/{})", what, attempt,
                   policy.attempts);
      sleeper(delay);
    }
  }
  spdlog::warn("{} not satisfied after {} attempt(s)", what, policy.attempts);
  return false;
}

}  // namespace steward::common
