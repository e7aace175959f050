#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "time.hpp"

namespace swarm::util {

/*
  Injectable clock. Every component that stamps or expires state reads
  time through one of these so tests can drive TTLs deterministically.
*/
class Clock {
 public:
  virtual ~Clock() = default;

  virtual int64_t NowMillis() const = 0;
};

class SystemClock final : public Clock {
 public:
  int64_t NowMillis() const override {
    return ToUnixMillis(Now());
  }
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(int64_t start_ms = 1700000000000) : now_ms_(start_ms) {
  }

  int64_t NowMillis() const override {
    return now_ms_.load();
  }

  void Set(int64_t ms) {
    now_ms_.store(ms);
  }

  void Advance(std::chrono::milliseconds delta) {
    now_ms_.fetch_add(delta.count());
  }

 private:
  std::atomic<int64_t> now_ms_;
};

} // namespace swarm::util
