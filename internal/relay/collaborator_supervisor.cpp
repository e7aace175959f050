#include "collaborator_supervisor.hpp"

#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/relay/relay_transport.hpp"

namespace swarm::relay {

ProcessSupervisor::ProcessSupervisor(std::string command, std::shared_ptr<RelayTransport> health,
                                     std::chrono::milliseconds wait, std::chrono::milliseconds poll_interval)
    : command_(std::move(command)), health_(std::move(health)), wait_(wait), poll_interval_(poll_interval) {
  if (command_.empty()) throw std::invalid_argument("ProcessSupervisor: restart command is required");
  if (!health_) throw std::invalid_argument("ProcessSupervisor: health transport is required");
}

void ProcessSupervisor::ReapExitedLocked() {
  for (auto it = children_.begin(); it != children_.end();) {
    int         status = 0;
    const pid_t reaped = ::waitpid(*it, &status, WNOHANG);
    if (reaped == 0) {
      ++it;
      continue;
    }
    if (reaped == *it) {
      SWARM_LOG_WARN("relay process exited", {observability::IntField("pid", *it),
                                              observability::IntField("status", status)});
    } else if (errno != ECHILD) {
      SWARM_LOG_ERROR("relay process wait failed", {observability::IntField("pid", *it),
                                                    observability::StringField("error", std::strerror(errno))});
      ++it;
      continue;
    }
    if (*it == last_pid_) last_pid_ = -1;
    it = children_.erase(it);
  }
}

bool ProcessSupervisor::Restart() {
  {
    std::lock_guard lock(mutex_);
    ReapExitedLocked();

    const pid_t pid = ::fork();
    if (pid < 0) {
      SWARM_LOG_ERROR("relay restart fork failed", {observability::StringField("error", std::strerror(errno))});
      return false;
    }
    if (pid == 0) {
      ::setsid();
      ::execl("/bin/sh", "sh", "-c", command_.c_str(), static_cast<char*>(nullptr));
      ::_exit(127);
    }
    last_pid_ = pid;
    children_.push_back(pid);

    SWARM_LOG_WARN("relay restart launched", {observability::StringField("command", command_),
                                              observability::IntField("pid", pid)});
  }

  const auto deadline = std::chrono::steady_clock::now() + wait_;
  while (std::chrono::steady_clock::now() < deadline) {
    if (health_->Healthy(poll_interval_)) return true;
    std::this_thread::sleep_for(poll_interval_);
  }
  return health_->Healthy(poll_interval_);
}

std::size_t ProcessSupervisor::RunningChildren() {
  std::lock_guard lock(mutex_);
  ReapExitedLocked();
  return children_.size();
}

pid_t ProcessSupervisor::LastPid() const {
  std::lock_guard lock(mutex_);
  return last_pid_;
}

} // namespace swarm::relay
