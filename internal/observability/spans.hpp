#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace omni::runtime::config {
class RuntimeConfig;
}

namespace omni::observability {

/*
  Tracing and metrics facade.

  With OMNI_ENABLE_OTEL the calls export through opentelemetry-cpp;
  without it every call below is an inline no-op.
*/

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"omni"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const omni::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const omni::runtime::config::RuntimeConfig& config);
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
#ifdef OMNI_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // One per persisted signal row, labelled buy/sell/hold.
  void RecordSignal(std::string_view kind);
  // reason: "late_arrival", "correction", "resume", "rebuild"
  void ObserveRecomputeDurationMs(std::string_view reason, double duration_ms, std::uint64_t rows);

  void RecordEmbeddingJob(bool success);
  void SetIndexedChunks(std::uint64_t chunks);

 private:
  Metrics();
#ifdef OMNI_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef OMNI_ENABLE_OTEL
inline bool InitializeTracing(const omni::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const omni::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordSignal(std::string_view) {
}

inline void Metrics::ObserveRecomputeDurationMs(std::string_view, double, std::uint64_t) {
}

inline void Metrics::RecordEmbeddingJob(bool) {
}

inline void Metrics::SetIndexedChunks(std::uint64_t) {
}
#endif

} // namespace omni::observability
