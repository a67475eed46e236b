/*
 * 설명: 매치별 물리 단계와 전체 활성 매치 틱 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/physics_step_test.cpp, server/tests/unit/physics_engine_test.cpp
 */
#include "pong/physics.hpp"

#include <cmath>
#include <exception>
#include <stdexcept>

namespace pong {

PhysicsEngine::PhysicsEngine(std::shared_ptr<MatchRegistry> registry, std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), observability_(std::move(observability)) {}

std::vector<TickOutcome> PhysicsEngine::TickAll(std::chrono::steady_clock::time_point now) {
  std::vector<TickOutcome> outcomes;
  for (const auto& match_id : registry_->AllActiveIds()) {
    try {
      TickOutcome outcome;
      outcome.match_id = match_id;
      bool ticked = registry_->Mutate(match_id, [&](MatchRecord& record) {
        double dt = 0.0;
        // 스냅샷 이후 생성된 매치는 now보다 늦은 시각을 갖고 있을 수 있다.
        if (now > record.last_tick) {
          dt = std::chrono::duration<double>(now - record.last_tick).count();
          record.last_tick = now;
        }
        outcome.step = Step(record.state, dt, record.rng);
        outcome.state = record.state;
      });
      if (!ticked) {
        continue;
      }
      if (outcome.step.player1_scored || outcome.step.player2_scored) {
        LogMatchEvent(match_id, "match.score", LogLevel::kInfo);
      }
      outcomes.push_back(std::move(outcome));
    } catch (const std::exception& ex) {
      if (observability_) {
        observability_->IncrementTickError();
      }
      LogMatchEvent(match_id, std::string("match.tick_failed: ") + ex.what(), LogLevel::kError);
    }
  }
  return outcomes;
}

StepResult PhysicsEngine::Step(MatchState& state, double dt, std::mt19937_64& rng) {
  if (!std::isfinite(state.ball_x) || !std::isfinite(state.ball_y) || !std::isfinite(state.ball_velocity_x) ||
      !std::isfinite(state.ball_velocity_y)) {
    throw std::domain_error("공 상태가 유한하지 않습니다");
  }
  StepResult result;
  state.ball_x += state.ball_velocity_x * dt;
  state.ball_y += state.ball_velocity_y * dt;

  if (state.ball_y < 0.0) {
    state.ball_y = 0.0;
    state.ball_velocity_y = -state.ball_velocity_y;
  }
  if (state.ball_y > 1.0) {
    state.ball_y = 1.0;
    state.ball_velocity_y = -state.ball_velocity_y;
  }

  constexpr double half_height = kPaddleHeight / 2;
  const double left_face = kLeftPaddleX + kPaddleThickness;
  const double right_face = kRightPaddleX - kPaddleThickness;

  if (state.ball_x > kLeftPaddleX && state.ball_x < left_face && state.ball_y > state.paddle1_y - half_height &&
      state.ball_y < state.paddle1_y + half_height && state.ball_velocity_x < 0.0) {
    state.ball_x = left_face;
    state.ball_velocity_x = -state.ball_velocity_x;
    state.ball_velocity_y += (state.ball_y - state.paddle1_y) * kDeflectFactor;
    result.left_paddle_hit = true;
  }

  if (state.ball_x > right_face && state.ball_x < kRightPaddleX && state.ball_y > state.paddle2_y - half_height &&
      state.ball_y < state.paddle2_y + half_height && state.ball_velocity_x > 0.0) {
    state.ball_x = right_face;
    state.ball_velocity_x = -state.ball_velocity_x;
    state.ball_velocity_y += (state.ball_y - state.paddle2_y) * kDeflectFactor;
    result.right_paddle_hit = true;
  }

  // 경계에 정확히 닿아도 득점으로 본다. 속도 0.5로 1초 진행한 공은 정확히 1.0에 멈춘다.
  if (state.ball_x <= 0.0) {
    ++state.score2;
    ResetBall(state, 1, rng);
    result.player2_scored = true;
  }
  if (state.ball_x >= 1.0) {
    ++state.score1;
    ResetBall(state, -1, rng);
    result.player1_scored = true;
  }
  return result;
}

void PhysicsEngine::ResetBall(MatchState& state, int direction, std::mt19937_64& rng) {
  state.ball_x = 0.5;
  state.ball_y = 0.5;
  state.ball_velocity_x = kServeSpeedX * direction;
  state.ball_velocity_y = RandomServeVelocityY(rng);
}

void PhysicsEngine::LogMatchEvent(const std::string& match_id, const std::string& name, LogLevel level) const {
  if (!observability_) {
    return;
  }
  observability_->Log(LogContext{observability_->NextTraceId(), std::nullopt, match_id, name, 0, level});
}

}  // namespace pong
