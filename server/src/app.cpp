/*
 * 설명: 서버 수명주기와 리스닝 스레드, 게임 루프를 관리하고 환경설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/match_flow_test.cpp, server/tests/e2e/metrics_static_test.cpp
 */
#include "pong/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "pong/http_session.hpp"

namespace pong {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<SessionManager> session_manager,
           std::shared_ptr<MatchRegistry> registry, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), coordinator_(std::move(coordinator)),
        session_manager_(std::move(session_manager)), registry_(std::move(registry)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->coordinator_,
                                          self->session_manager_, self->registry_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<MatchRegistry> registry_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  auto level = ParseLogLevel(config.log_level);
  if (!level) {
    std::cerr << "알 수 없는 LOG_LEVEL '" << config.log_level << "', info로 대체합니다\n";
  }
  observability_ = std::make_shared<Observability>(level.value_or(LogLevel::kInfo));
  coordinator_ = std::make_shared<RealtimeCoordinator>();
  coordinator_->SetObservability(observability_);
  registry_ = std::make_shared<MatchRegistry>(config.match_rng_seed);
  physics_ = std::make_shared<PhysicsEngine>(registry_, observability_);
  session_manager_ = std::make_shared<SessionManager>(registry_, coordinator_, observability_);
  game_loop_ = std::make_shared<GameLoop>(ioc_, physics_, coordinator_, observability_,
                                          std::chrono::microseconds(config.tick_interval_us),
                                          config.broadcast_state_to_all);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, coordinator_, session_manager_, registry_,
                                           observability_);
    listener_->Run();
    game_loop_->Start();
    std::cout << "Parker Pong 서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  game_loop_->Stop();
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("PORT", "3000")));
  cfg.static_root = get_env("STATIC_ROOT", "public");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.http_read_timeout_seconds = static_cast<std::size_t>(std::stoul(get_env("HTTP_READ_TIMEOUT_SECONDS", "30")));
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "256")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.tick_interval_us = static_cast<std::size_t>(std::stoul(get_env("TICK_INTERVAL_US", "16667")));
  cfg.match_rng_seed = static_cast<std::uint64_t>(std::stoull(get_env("MATCH_RNG_SEED", "20240601")));
  auto broadcast = get_env("BROADCAST_STATE_TO_ALL", "false");
  cfg.broadcast_state_to_all = broadcast == "true" || broadcast == "1";
  return cfg;
}

}  // namespace pong
