/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/metrics_static_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace pong {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view value);
std::string_view LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<std::uint64_t> connection_id;
  std::optional<std::string> match_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t active_matches{0};
  std::uint64_t ended_matches{0};
  std::uint64_t ticks_total{0};
  std::uint64_t tick_errors{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void IncrementTick();
  void IncrementTickError();
  MetricsSnapshot Snapshot(std::uint64_t active_matches, std::uint64_t ended_matches) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> ticks_total_{0};
  std::atomic<std::uint64_t> tick_errors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace pong
