#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace engram::observability {

/*
  Runs `fn` inside a span and records operation count + latency.
  Exceptions are logged and rethrown; validation failures log at warn.
*/
template <typename Fn>
auto ObserveOperation(std::string_view operation, Fn&& fn) {
  SpanScope  span(operation);
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      Metrics::Instance().RecordOperation(operation, true, elapsed_ms());
      return;
    } else {
      auto result = fn();
      Metrics::Instance().RecordOperation(operation, true, elapsed_ms());
      return result;
    }
  } catch (const util::InvalidArgument& ex) {
    span.RecordException(ex.what());
    ENGRAM_LOG_WARN("operation rejected", {StringField("operation", operation), StringField("error", ex.what())});
    Metrics::Instance().RecordOperation(operation, false, elapsed_ms());
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ENGRAM_LOG_ERROR("operation failed", {StringField("operation", operation), StringField("error", ex.what())});
    Metrics::Instance().RecordOperation(operation, false, elapsed_ms());
    throw;
  }
}

} // namespace engram::observability
