#include "session_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"

namespace swarm::session {

namespace {

constexpr const char* kSuffix = ".session.json";

void RequireSessionId(const std::string& session_id) {
  if (session_id.empty()) throw util::ValidationError("session_id", "session id is required");

  const bool safe = std::all_of(session_id.begin(), session_id.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
           c == '.';
  });
  if (!safe || session_id == "." || session_id == "..") {
    throw util::ValidationError("session_id", "session id may only contain [A-Za-z0-9._-]");
  }
}

} // namespace

SessionStore::SessionStore(std::string state_dir, std::shared_ptr<util::Clock> clock)
    : state_dir_(std::move(state_dir)), clock_(std::move(clock)) {
  if (state_dir_.empty()) throw std::invalid_argument("SessionStore: state dir is required");
  if (!clock_) throw std::invalid_argument("SessionStore: clock is required");
}

std::string SessionStore::PathFor(const std::string& session_id) const {
  RequireSessionId(session_id);
  return (std::filesystem::path(state_dir_) / (session_id + kSuffix)).string();
}

std::optional<relay::v1::SessionState> SessionStore::Load(const std::string& session_id) const {
  std::ifstream in(PathFor(session_id));
  if (!in) return std::nullopt;

  std::stringstream json;
  json << in.rdbuf();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  relay::v1::SessionState state;
  auto                    status = google::protobuf::util::JsonStringToMessage(json.str(), &state, options);
  if (!status.ok()) {
    throw std::runtime_error("corrupt session file for " + session_id + ": " + std::string(status.message()));
  }
  return state;
}

void SessionStore::Save(relay::v1::SessionState state) {
  const auto path = PathFor(state.session_id());
  state.set_updated_at_ms(clock_->NowMillis());

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  options.add_whitespace             = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(state, &json, options);
  if (!status.ok()) throw std::runtime_error("session encode failed: " + std::string(status.message()));

  std::filesystem::create_directories(state_dir_);

  const auto tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    out << json;
    out.flush();
    if (!out) throw std::runtime_error("failed to write " + tmp);
  }
  std::filesystem::rename(tmp, path);
}

bool SessionStore::Remove(const std::string& session_id) {
  return std::filesystem::remove(PathFor(session_id));
}

std::vector<std::string> SessionStore::List() const {
  std::vector<std::string> ids;

  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(state_dir_, ec)) {
    const auto name = entry.path().filename().string();
    const auto len  = std::char_traits<char>::length(kSuffix);
    if (name.size() > len && name.compare(name.size() - len, len, kSuffix) == 0) {
      ids.push_back(name.substr(0, name.size() - len));
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

} // namespace swarm::session
