/*
 * 설명: 물리 틱을 고정 지연으로 재예약하고 매치별 상태를 브로드캐스트한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_loop_test.cpp, server/tests/e2e/match_flow_test.cpp
 */
#include "pong/game_loop.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>

namespace pong {

GameLoop::GameLoop(boost::asio::io_context& ioc, std::shared_ptr<PhysicsEngine> engine,
                   std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<Observability> observability,
                   std::chrono::microseconds tick_interval, bool broadcast_to_all)
    : strand_(boost::asio::make_strand(ioc)), timer_(ioc), engine_(std::move(engine)),
      coordinator_(std::move(coordinator)), observability_(std::move(observability)), tick_interval_(tick_interval),
      broadcast_to_all_(broadcast_to_all) {}

void GameLoop::Start() {
  if (running_.exchange(true)) {
    return;
  }
  boost::asio::dispatch(strand_, [self = shared_from_this()]() { self->ScheduleTick(); });
}

void GameLoop::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  boost::asio::dispatch(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
}

void GameLoop::ScheduleTick() {
  // 틱 처리 시간과 무관하게 항상 같은 지연 뒤에 다시 실행한다.
  timer_.expires_after(tick_interval_);
  auto self = shared_from_this();
  timer_.async_wait(boost::asio::bind_executor(strand_, [self](const boost::system::error_code& ec) {
    if (!ec) {
      self->HandleTick();
    }
  }));
}

void GameLoop::HandleTick() {
  if (!running_) {
    return;
  }
  auto outcomes = engine_->TickAll(std::chrono::steady_clock::now());
  for (const auto& outcome : outcomes) {
    auto payload = ToStatePayload(outcome.match_id, outcome.state);
    coordinator_->SendEventToMatch(outcome.match_id, "state", payload);
    if (broadcast_to_all_) {
      coordinator_->SendEventToAll("state", payload);
    }
  }
  tick_count_.fetch_add(1);
  if (observability_) {
    observability_->IncrementTick();
  }
  ScheduleTick();
}

}  // namespace pong
