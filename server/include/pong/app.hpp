/*
 * 설명: 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/match_flow_test.cpp, server/tests/e2e/metrics_static_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "pong/config.hpp"
#include "pong/game_loop.hpp"
#include "pong/match_registry.hpp"
#include "pong/observability.hpp"
#include "pong/physics.hpp"
#include "pong/realtime.hpp"
#include "pong/session_manager.hpp"

namespace pong {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<MatchRegistry> GetMatchRegistry() { return registry_; }
  std::shared_ptr<SessionManager> GetSessionManager() { return session_manager_; }
  std::shared_ptr<RealtimeCoordinator> GetCoordinator() { return coordinator_; }
  std::shared_ptr<GameLoop> GetGameLoop() { return game_loop_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<MatchRegistry> registry_;
  std::shared_ptr<PhysicsEngine> physics_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<GameLoop> game_loop_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace pong
