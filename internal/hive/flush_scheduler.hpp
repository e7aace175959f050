#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace swarm::hive {

class FlushManager;

/*
  Background flusher.

  ScheduleFlush() requests a flush no later than `debounce` from the first
  pending request; further requests inside that window coalesce. With a
  non-zero `interval` the worker also flushes on that period. Stop() joins
  the worker and performs one final flush.
*/
class FlushScheduler {
 public:
  FlushScheduler(std::shared_ptr<FlushManager> flush, std::chrono::milliseconds debounce,
                 std::chrono::milliseconds interval = std::chrono::milliseconds(0));
  ~FlushScheduler();

  void Start();
  void Stop();

  void ScheduleFlush();

  // Completed flush passes, including ones that exported nothing.
  uint64_t FlushCount() const {
    return flush_count_.load();
  }

 private:
  using SteadyClock = std::chrono::steady_clock;

  void Run();
  void FlushOnce();

  std::shared_ptr<FlushManager> flush_;
  std::chrono::milliseconds     debounce_;
  std::chrono::milliseconds     interval_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::optional<SteadyClock::time_point> pending_deadline_;
  bool                                   stopping_ = false;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> flush_count_{0};
};

} // namespace swarm::hive
