#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace swarm::relay {

class RelayTransport;

// Restarts an out-of-process collaborator.
class CollaboratorSupervisor {
 public:
  virtual ~CollaboratorSupervisor() = default;

  // True when the collaborator is reachable again afterwards.
  virtual bool Restart() = 0;
};

/*
  Launches `command` through /bin/sh in its own session and polls the
  health check until it answers or `wait` elapses. The launched process is
  left running; it is the collaborator. Every child launched so far is
  reaped once it exits.
*/
class ProcessSupervisor final : public CollaboratorSupervisor {
 public:
  ProcessSupervisor(std::string command, std::shared_ptr<RelayTransport> health, std::chrono::milliseconds wait,
                    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

  bool Restart() override;

  pid_t LastPid() const;

  // Reaps exited children and returns how many are still running.
  std::size_t RunningChildren();

 private:
  void ReapExitedLocked();

  std::string                     command_;
  std::shared_ptr<RelayTransport> health_;
  std::chrono::milliseconds       wait_;
  std::chrono::milliseconds       poll_interval_;

  mutable std::mutex mutex_;
  pid_t              last_pid_ = -1;
  std::vector<pid_t> children_;
};

} // namespace swarm::relay
