#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "swarm/relay/v1.hpp"

namespace swarm::util { class Clock; }

namespace swarm::session {

/*
  On-disk relay session state, one JSON file per session id under
  state_dir. Writes go through a temporary file and rename.
*/
class SessionStore {
 public:
  SessionStore(std::string state_dir, std::shared_ptr<util::Clock> clock);

  std::optional<relay::v1::SessionState> Load(const std::string& session_id) const;

  // Stamps updated_at_ms.
  void Save(relay::v1::SessionState state);

  // True when a file was removed.
  bool Remove(const std::string& session_id);

  std::vector<std::string> List() const;

 private:
  std::string PathFor(const std::string& session_id) const;

  std::string                  state_dir_;
  std::shared_ptr<util::Clock> clock_;
};

} // namespace swarm::session
