/*
 * 설명: 매치 하나의 권위 있는 게임 상태와 JSON 직렬화를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_registry_test.cpp, server/tests/unit/physics_step_test.cpp
 */
#pragma once

#include <random>
#include <string>

#include <nlohmann/json.hpp>

namespace pong {

struct MatchState {
  double paddle1_y{0.5};
  double paddle2_y{0.5};
  double ball_x{0.5};
  double ball_y{0.5};
  double ball_velocity_x{0.0};
  double ball_velocity_y{0.0};
  int score1{0};
  int score2{0};
};

constexpr double kServeSpeedX = 0.5;
constexpr double kMaxServeSpeedY = 0.3;

// [-kMaxServeSpeedY, kMaxServeSpeedY] 범위의 균등 분포 값.
double RandomServeVelocityY(std::mt19937_64& rng);
MatchState MakeInitialMatchState(std::mt19937_64& rng);

// 클라이언트 계약의 state 페이로드 필드명을 사용한다.
nlohmann::json ToStatePayload(const std::string& match_id, const MatchState& state);

}  // namespace pong
