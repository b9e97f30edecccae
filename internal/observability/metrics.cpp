#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <array>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace edgesync::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;
bool                                        g_enabled{false};

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> send_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> evicted_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> ingest_drop_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      ack_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::mutex                   queue_depth_mutex;
  std::array<std::int64_t, 6>  queue_depth{};
};

bool InitializeMetrics(const edgesync::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == edgesync::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms                = observability.collection_interval_ms() > 0 ? observability.collection_interval_ms() : 10000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);

  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}, {"node.id", config.node().node_id()}};
  auto                         res   = resource::Resource::Create(attrs);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  g_enabled = true;
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
  g_enabled = false;
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("edge-sync", "0.1.0");

  impl_->send_count        = impl_->meter->CreateUInt64Counter("edgesync.send.count", "1", "Records transmitted to the gateway");
  impl_->evicted_count     = impl_->meter->CreateUInt64Counter("edgesync.evicted.count", "1", "Records evicted by retention or quota");
  impl_->ingest_drop_count = impl_->meter->CreateUInt64Counter("edgesync.ingest.dropped", "1", "Records dropped at the producer handoff");
  impl_->ack_latency_ms    = impl_->meter->CreateDoubleHistogram("edgesync.ack.latency_ms", "ms", "Send to ack latency");
  impl_->queue_depth_gauge = impl_->meter->CreateInt64ObservableGauge("edgesync.queue.depth", "Queued records per priority", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->queue_depth_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (size_t p = 0; p < impl->queue_depth.size(); ++p) {
          const std::initializer_list<AttributePair> attributes = {{"priority", static_cast<std::int64_t>(p)}};
          int_result->Observe(impl->queue_depth[p], attributes);
        }
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordSend(int priority, bool acked) {
  if (!g_enabled || !impl_->send_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"priority", static_cast<std::int64_t>(priority)}, {"acked", acked}};
  impl_->send_count->Add(1, attributes);
}

void Metrics::ObserveAckLatencyMs(double latency_ms) {
  if (!g_enabled || !impl_->ack_latency_ms) {
    return;
  }
  impl_->ack_latency_ms->Record(latency_ms, opentelemetry::context::Context{});
}

void Metrics::RecordEvicted(int priority, std::uint64_t count) {
  if (!g_enabled || !impl_->evicted_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"priority", static_cast<std::int64_t>(priority)}};
  impl_->evicted_count->Add(count, attributes);
}

void Metrics::RecordIngestDrop(int priority) {
  if (!g_enabled || !impl_->ingest_drop_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"priority", static_cast<std::int64_t>(priority)}};
  impl_->ingest_drop_count->Add(1, attributes);
}

void Metrics::SetQueueDepth(int priority, std::uint64_t depth) {
  if (priority < 0 || priority >= static_cast<int>(impl_->queue_depth.size())) {
    return;
  }
  std::lock_guard<std::mutex> lock(impl_->queue_depth_mutex);
  impl_->queue_depth[static_cast<size_t>(priority)] = static_cast<std::int64_t>(depth);
}

} // namespace edgesync::observability

#endif
