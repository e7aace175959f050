#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace swarm::runtime::config {
class RuntimeConfig;
}

namespace swarm::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"swarm-hive"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const swarm::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const swarm::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordCommand(std::string_view operation, bool success);
  void ObserveCommandLatencyMs(std::string_view operation, double latency_ms);
  void RecordFlush(std::uint64_t exported, std::uint64_t failed, double duration_ms);
  void RecordReservationConflicts(std::uint64_t conflicts);
  void RecordRelayTransition(std::string_view to_state);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const swarm::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const swarm::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordCommand(std::string_view, bool) {
}

inline void Metrics::ObserveCommandLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordFlush(std::uint64_t, std::uint64_t, double) {
}

inline void Metrics::RecordReservationConflicts(std::uint64_t) {
}

inline void Metrics::RecordRelayTransition(std::string_view) {
}
#endif

} // namespace swarm::observability
