/*
 * 설명: WebSocket 연결의 메시지 처리, 송신 큐/백프레셔, 세션 이벤트 전달을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/match_flow_test.cpp, server/tests/e2e/connection_limits_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "pong/api_response.hpp"
#include "pong/observability.hpp"
#include "pong/realtime.hpp"
#include "pong/session_manager.hpp"

namespace pong {

class WebSocketSession : public EventSink, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<RealtimeCoordinator> coordinator,
                   std::shared_ptr<SessionManager> session_manager, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 어느 스레드에서 불러도 되며 연결의 executor로 넘겨 큐에 넣는다.
  void SendServerEvent(const std::string& event, const nlohmann::json& payload) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleJoin(const nlohmann::json& payload, std::uint64_t seq);
  void HandlePaddle(const nlohmann::json& payload, std::uint64_t seq);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void Disconnect();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  Session session_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool disconnected_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace pong
