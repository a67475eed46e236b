/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "pong/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace pong {

std::optional<LogLevel> ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::IncrementTick() { ticks_total_.fetch_add(1); }

void Observability::IncrementTickError() { tick_errors_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_matches, std::uint64_t ended_matches) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.active_matches = active_matches;
  snapshot.ended_matches = ended_matches;
  snapshot.ticks_total = ticks_total_.load();
  snapshot.tick_errors = tick_errors_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (ctx.match_id) {
    log_json["matchId"] = *ctx.match_id;
  }
  std::cout << log_json.dump() << std::endl;
}

}  // namespace pong
