#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace omni::service {

// Wraps one RPC in a span and records request count and latency for `route`.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  omni::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      omni::observability::Metrics::Instance().RecordRequest(route, true);
      omni::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      omni::observability::Metrics::Instance().RecordRequest(route, true);
      omni::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    OMNI_LOG_ERROR("RPC failed", {omni::observability::StringField("route", route), omni::observability::StringField("error", ex.what())});
    omni::observability::Metrics::Instance().RecordRequest(route, false);
    omni::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace omni::service
