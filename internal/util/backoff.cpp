#include "backoff.hpp"

#include <algorithm>

namespace swarm::util {

std::chrono::milliseconds BackoffDelay(const BackoffPolicy& policy, uint32_t attempt, std::mt19937_64& rng) {
  if (attempt == 0) attempt = 1;

  const uint32_t shift  = std::min<uint32_t>(attempt - 1, 30);
  const int64_t  raw    = policy.base_delay.count() * (int64_t{1} << shift);
  const int64_t  capped = std::min<int64_t>(raw, policy.max_delay.count());

  if (policy.jitter_percent == 0 || capped == 0) {
    return std::chrono::milliseconds(capped);
  }

  const double                           spread = static_cast<double>(policy.jitter_percent) / 100.0;
  std::uniform_real_distribution<double> dist(-spread, spread);
  const double                           jittered = static_cast<double>(capped) * (1.0 + dist(rng));
  return std::chrono::milliseconds(std::max<int64_t>(0, static_cast<int64_t>(jittered)));
}

std::chrono::milliseconds BackoffDelay(const BackoffPolicy& policy, uint32_t attempt) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  return BackoffDelay(policy, attempt, rng);
}

} // namespace swarm::util
