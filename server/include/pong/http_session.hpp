/*
 * 설명: HTTP 연결을 처리하고 헬스/메트릭 엔드포인트, 정적 클라이언트 파일, WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/metrics_static_test.cpp, server/tests/e2e/match_flow_test.cpp, server/tests/e2e/connection_limits_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "pong/api_response.hpp"
#include "pong/config.hpp"
#include "pong/match_registry.hpp"
#include "pong/observability.hpp"
#include "pong/realtime.hpp"
#include "pong/session_manager.hpp"
#include "pong/websocket_session.hpp"

namespace pong {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<RealtimeCoordinator> coordinator,
              std::shared_ptr<SessionManager> session_manager,
              std::shared_ptr<MatchRegistry> registry,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void ServeStatic(const std::string& path, const std::shared_ptr<Response>& res);
  void SendEnvelope(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                    const nlohmann::json& envelope);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<MatchRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace pong
