#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace framecomp::service {

/*
  Span, request metrics and failure logging around one RPC body.
  Exceptions are rethrown untouched for the gRPC layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& project_id, Fn&& fn) {
  framecomp::observability::SpanScope span(route);
  if (!project_id.empty()) {
    span.SetAttribute("project.id", project_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool success) {
    framecomp::observability::Metrics::Instance().RecordRequest(route, success);
    framecomp::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    FRAMECOMP_LOG_ERROR("RPC failed", {framecomp::observability::StringField("route", route),
                                       framecomp::observability::StringField("error", ex.what()),
                                       framecomp::observability::StringField("project_id", project_id)});
    record(false);
    throw;
  }
}

} // namespace framecomp::service
