#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define SWARM_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define SWARM_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace swarm::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const swarm::runtime::config::ObservabilityConfig& observability, bool http) {
  if (!observability.otlp_endpoint().empty()) {
    return observability.otlp_endpoint();
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return http ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> command_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      command_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> flushed_cells;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      flush_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reservation_conflicts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> relay_transitions;
};

bool InitializeMetrics(const swarm::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const bool http     = observability.transport() == swarm::runtime::config::OTLP_TRANSPORT_HTTP;
  const auto endpoint = ResolveEndpoint(observability, http);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = false;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);

#ifdef SWARM_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  const std::string            service_name = observability.service_name().empty() ? "swarm-hive" : observability.service_name();
  resource::ResourceAttributes attrs        = {{"service.name", service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("swarm-hive", "0.1.0");

  impl_->command_count      = impl_->meter->CreateUInt64Counter("swarm.hive.command.count", "Hive commands executed", "1");
  impl_->command_latency_ms = impl_->meter->CreateDoubleHistogram("swarm.hive.command.latency_ms", "Hive command latency", "ms");
  impl_->flushed_cells      = impl_->meter->CreateUInt64Counter("swarm.hive.flush.cells", "Cells written to the export file", "1");
  impl_->flush_duration_ms  = impl_->meter->CreateDoubleHistogram("swarm.hive.flush.duration_ms", "Export flush duration", "ms");
  impl_->reservation_conflicts =
      impl_->meter->CreateUInt64Counter("swarm.reservation.conflicts", "Paths refused because another agent holds them", "1");
  impl_->relay_transitions = impl_->meter->CreateUInt64Counter("swarm.relay.transitions", "Relay recovery state transitions", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordCommand(std::string_view operation, bool success) {
  if (!impl_ || !impl_->command_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"operation", std::string(operation)}, {"success", success}};
  AddWithAttributes(impl_->command_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveCommandLatencyMs(std::string_view operation, double latency_ms) {
  if (!impl_ || !impl_->command_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"operation", std::string(operation)}};
  RecordWithAttributes(impl_->command_latency_ms, latency_ms, attributes);
}

void Metrics::RecordFlush(std::uint64_t exported, std::uint64_t failed, double duration_ms) {
  if (!impl_ || !impl_->flushed_cells) {
    return;
  }

  const std::initializer_list<AttributePair> ok  = {{"outcome", "exported"}};
  const std::initializer_list<AttributePair> bad = {{"outcome", "failed"}};
  AddWithAttributes(impl_->flushed_cells, exported, ok);
  AddWithAttributes(impl_->flushed_cells, failed, bad);
  RecordWithAttributes(impl_->flush_duration_ms, duration_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordReservationConflicts(std::uint64_t conflicts) {
  if (!impl_ || !impl_->reservation_conflicts || conflicts == 0) {
    return;
  }

  AddWithAttributes(impl_->reservation_conflicts, conflicts, std::initializer_list<AttributePair>{});
}

void Metrics::RecordRelayTransition(std::string_view to_state) {
  if (!impl_ || !impl_->relay_transitions) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"state", std::string(to_state)}};
  AddWithAttributes(impl_->relay_transitions, static_cast<std::uint64_t>(1), attributes);
}

} // namespace swarm::observability

#endif
