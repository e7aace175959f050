#pragma once

#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace swarm::util {

/*
  Bounded exponential backoff with jitter.

  delay(attempt) = min(base * 2^(attempt-1), max_delay) * (1 +/- jitter)
  attempt is 1-based.
*/
struct BackoffPolicy {
  uint32_t                  max_retries    = 3;
  std::chrono::milliseconds base_delay     = std::chrono::milliseconds(100);
  std::chrono::milliseconds max_delay      = std::chrono::milliseconds(5000);
  uint32_t                  jitter_percent = 20;
};

std::chrono::milliseconds BackoffDelay(const BackoffPolicy& policy, uint32_t attempt, std::mt19937_64& rng);

// Same as above with a thread-local generator.
std::chrono::milliseconds BackoffDelay(const BackoffPolicy& policy, uint32_t attempt);

/*
  Runs fn, retrying on util::TransientError up to policy.max_retries extra
  attempts. Exhaustion raises util::RetriesExhausted with the last cause.
*/
template <typename Fn>
auto RetryTransient(const BackoffPolicy& policy, const char* operation, Fn&& fn) -> decltype(fn()) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const TransientError& e) {
      if (attempt > policy.max_retries) {
        SWARM_LOG_ERROR("retries exhausted", {observability::StringField("operation", operation),
                                              observability::IntField("attempts", attempt),
                                              observability::StringField("error", e.what())});
        throw RetriesExhausted(static_cast<int>(attempt), e.what());
      }

      const auto delay = BackoffDelay(policy, attempt);
      SWARM_LOG_WARN("transient failure, retrying", {observability::StringField("operation", operation),
                                                     observability::IntField("attempt", attempt),
                                                     observability::IntField("delay_ms", delay.count()),
                                                     observability::StringField("error", e.what())});
      std::this_thread::sleep_for(delay);
    }
  }
}

} // namespace swarm::util
