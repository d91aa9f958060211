#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace gigbook::service {

/*
  Runs one service call, logging its latency at debug level and any
  escaping exception at error level. Exceptions are rethrown unchanged.
*/
template <typename Fn>
auto Observe(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto elapsed_ms = [&started_at] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      GIGBOOK_LOG_DEBUG("service call", {observability::StringField("route", route), observability::DoubleField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      GIGBOOK_LOG_DEBUG("service call", {observability::StringField("route", route), observability::DoubleField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    GIGBOOK_LOG_ERROR("service call failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                              observability::DoubleField("latency_ms", elapsed_ms())});
    throw;
  }
}

} // namespace gigbook::service
