/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/match_flow_test.cpp, server/tests/e2e/metrics_static_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pong {

struct AppConfig {
  unsigned short port;
  std::string static_root;
  std::string log_level;
  std::size_t http_read_timeout_seconds;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t tick_interval_us;
  std::uint64_t match_rng_seed;
  bool broadcast_state_to_all;
};

AppConfig LoadConfigFromEnv();

}  // namespace pong
