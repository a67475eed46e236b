/*
 * 설명: 측정된 경과 시간으로 공과 패들의 충돌, 득점, 서브를 처리하는 물리 단계를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/physics_step_test.cpp, server/tests/unit/physics_engine_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "pong/match_registry.hpp"
#include "pong/match_state.hpp"
#include "pong/observability.hpp"

namespace pong {

struct StepResult {
  bool left_paddle_hit{false};
  bool right_paddle_hit{false};
  bool player1_scored{false};
  bool player2_scored{false};
};

struct TickOutcome {
  std::string match_id;
  MatchState state;
  StepResult step;
};

class PhysicsEngine {
 public:
  static constexpr double kPaddleHeight = 0.25;
  static constexpr double kPaddleThickness = 0.03;
  static constexpr double kLeftPaddleX = 0.06;
  static constexpr double kRightPaddleX = 0.94;
  static constexpr double kDeflectFactor = 1.5;

  PhysicsEngine(std::shared_ptr<MatchRegistry> registry, std::shared_ptr<Observability> observability);

  // 활성 매치마다 마지막 틱 이후 경과 시간만큼 진행한다. 한 매치의 예외는 다른 매치에 영향을 주지 않는다.
  std::vector<TickOutcome> TickAll(std::chrono::steady_clock::time_point now);

  // 공 위치나 속도가 유한하지 않으면 std::domain_error를 던진다.
  static StepResult Step(MatchState& state, double dt, std::mt19937_64& rng);
  // direction: +1이면 오른쪽, -1이면 왼쪽으로 서브한다.
  static void ResetBall(MatchState& state, int direction, std::mt19937_64& rng);

 private:
  void LogMatchEvent(const std::string& match_id, const std::string& name, LogLevel level) const;

  std::shared_ptr<MatchRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace pong
