/*
 * 설명: 매치 상태를 클라이언트 계약의 JSON 페이로드로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_registry_test.cpp, server/tests/unit/session_manager_test.cpp
 */
#include "pong/match_state.hpp"

namespace pong {

double RandomServeVelocityY(std::mt19937_64& rng) {
  std::uniform_real_distribution<double> dist(-kMaxServeSpeedY, kMaxServeSpeedY);
  return dist(rng);
}

MatchState MakeInitialMatchState(std::mt19937_64& rng) {
  MatchState state;
  state.ball_velocity_x = kServeSpeedX;
  state.ball_velocity_y = RandomServeVelocityY(rng);
  return state;
}

nlohmann::json ToStatePayload(const std::string& match_id, const MatchState& state) {
  return {{"matchId", match_id},
          {"paddle1Y", state.paddle1_y},
          {"paddle2Y", state.paddle2_y},
          {"ballX", state.ball_x},
          {"ballY", state.ball_y},
          {"ballVelocityX", state.ball_velocity_x},
          {"ballVelocityY", state.ball_velocity_y},
          {"score1", state.score1},
          {"score2", state.score2}};
}

}  // namespace pong
