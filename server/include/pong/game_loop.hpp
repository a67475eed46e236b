/*
 * 설명: 고정 지연 타이머로 물리 엔진을 구동하고 매 틱 결과를 매치 구독자에게 전파한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_loop_test.cpp, server/tests/e2e/match_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "pong/observability.hpp"
#include "pong/physics.hpp"
#include "pong/realtime.hpp"

namespace pong {

class GameLoop : public std::enable_shared_from_this<GameLoop> {
 public:
  GameLoop(boost::asio::io_context& ioc, std::shared_ptr<PhysicsEngine> engine,
           std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<Observability> observability,
           std::chrono::microseconds tick_interval, bool broadcast_to_all);

  void Start();
  void Stop();
  std::uint64_t TickCount() const { return tick_count_.load(); }

 private:
  void ScheduleTick();
  void HandleTick();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::shared_ptr<PhysicsEngine> engine_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  std::chrono::microseconds tick_interval_;
  bool broadcast_to_all_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> tick_count_{0};
};

}  // namespace pong
