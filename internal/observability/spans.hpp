#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace framecomp::runtime::config {
class RuntimeConfig;
}

namespace framecomp::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"frame-compositor"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

OtlpConfig ToOtlpConfig(const framecomp::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const framecomp::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const framecomp::runtime::config::RuntimeConfig& config);
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
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process metrics.

  framecomp.request.count        route, success
  framecomp.request.latency_ms   route
  framecomp.item.duration_ms     outcome (succeeded | failed)
  framecomp.run.duration_ms      outcome (completed | failed | cancelled)
  framecomp.items.in_flight      compositing items currently running
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveItemDurationMs(std::string_view outcome, double duration_ms);
  void ObserveRunDurationMs(std::string_view outcome, double duration_ms);
  void AdjustItemsInFlight(std::int64_t delta);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline OtlpConfig ToOtlpConfig(const framecomp::runtime::config::RuntimeConfig&) {
  return {};
}

inline bool InitializeTracing(const framecomp::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const framecomp::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, double) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveItemDurationMs(std::string_view, double) {
}

inline void Metrics::ObserveRunDurationMs(std::string_view, double) {
}

inline void Metrics::AdjustItemsInFlight(std::int64_t) {
}
#endif

} // namespace framecomp::observability
