#include "flush_scheduler.hpp"

#include "internal/hive/flush_manager.hpp"
#include "internal/observability/logging.hpp"

namespace swarm::hive {

FlushScheduler::FlushScheduler(std::shared_ptr<FlushManager> flush, std::chrono::milliseconds debounce,
                               std::chrono::milliseconds interval)
    : flush_(std::move(flush)), debounce_(debounce), interval_(interval) {
}

FlushScheduler::~FlushScheduler() {
  if (running_) Stop();
}

void FlushScheduler::Start() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  running_ = true;
  thread_  = std::thread(&FlushScheduler::Run, this);
}

void FlushScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
  running_ = false;

  FlushOnce();
}

void FlushScheduler::ScheduleFlush() {
  {
    std::lock_guard lock(mutex_);
    if (!pending_deadline_) pending_deadline_ = SteadyClock::now() + debounce_;
  }
  cv_.notify_all();
}

void FlushScheduler::Run() {
  auto next_periodic = SteadyClock::now() + interval_;

  std::unique_lock lock(mutex_);
  while (!stopping_) {
    std::optional<SteadyClock::time_point> wake = pending_deadline_;
    if (interval_.count() > 0 && (!wake || next_periodic < *wake)) wake = next_periodic;

    if (wake) {
      cv_.wait_until(lock, *wake);
    } else {
      cv_.wait(lock);
    }
    if (stopping_) break;

    const auto now      = SteadyClock::now();
    const bool due      = pending_deadline_ && *pending_deadline_ <= now;
    const bool periodic = interval_.count() > 0 && next_periodic <= now;
    if (!due && !periodic) continue;

    pending_deadline_.reset();
    if (periodic) next_periodic = now + interval_;

    lock.unlock();
    FlushOnce();
    lock.lock();
  }
}

void FlushScheduler::FlushOnce() {
  try {
    flush_->Flush();
  } catch (const std::exception& e) {
    // Markers stay dirty; the next pass retries.
    SWARM_LOG_ERROR("scheduled flush failed", {observability::StringField("error", e.what())});
  }
  ++flush_count_;
}

} // namespace swarm::hive
