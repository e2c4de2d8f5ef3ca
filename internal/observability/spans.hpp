#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sealbench::runtime::config {
class RuntimeConfig;
}

namespace sealbench::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"sealbench"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

/*
  Both initializers return false (and install nothing) when the matching
  observability flag is off or the binary was built without OpenTelemetry.
*/
bool InitializeTracing(const sealbench::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const sealbench::runtime::config::RuntimeConfig& config);
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
#ifdef SEALBENCH_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordBenchmarkRun(std::string_view command, bool success);
  void ObserveBenchmarkDurationMs(std::string_view command, double duration_ms);
  void ObservePhaseDurationMs(std::string_view phase, double duration_ms);

 private:
  Metrics();
#ifdef SEALBENCH_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef SEALBENCH_ENABLE_OTEL
inline bool InitializeTracing(const sealbench::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const sealbench::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordBenchmarkRun(std::string_view, bool) {
}

inline void Metrics::ObserveBenchmarkDurationMs(std::string_view, double) {
}

inline void Metrics::ObservePhaseDurationMs(std::string_view, double) {
}
#endif

} // namespace sealbench::observability
