/*
 * 설명: WebSocket 메시지를 읽어 join/paddle/endMatch를 세션 관리자에 넘기고 서버 이벤트를 순서대로 송신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/match_flow_test.cpp, server/tests/e2e/connection_limits_test.cpp
 */
#include "pong/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace pong {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<RealtimeCoordinator> coordinator,
                                   std::shared_ptr<SessionManager> session_manager,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), coordinator_(std::move(coordinator)), session_manager_(std::move(session_manager)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { Disconnect(); }

void WebSocketSession::Run() {
  session_.connection_id = coordinator_->NextConnectionId();
  coordinator_->Register(session_.connection_id, shared_from_this());
  if (observability_) {
    observability_->Log(LogContext{observability_->NextTraceId(), session_.connection_id, std::nullopt,
                                   "connection.open", 0, LogLevel::kInfo});
  }
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec || closing_) {
    Disconnect();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());

  WsEnvelope frame;
  std::string error_message;
  if (!ParseClientFrame(data, frame, error_message)) {
    SendError("bad_request", error_message, frame.seq);
    return DoRead();
  }

  if (frame.event == "join") {
    HandleJoin(frame.payload, frame.seq);
  } else if (frame.event == "paddle") {
    HandlePaddle(frame.payload, frame.seq);
  } else if (frame.event == "endMatch") {
    session_manager_->EndMatch(session_);
  } else {
    SendError("bad_request", "알 수 없는 이벤트", frame.seq);
  }

  DoRead();
}

void WebSocketSession::HandleJoin(const nlohmann::json& payload, std::uint64_t seq) {
  if (!payload.contains("role") || !payload.contains("matchId")) {
    SendError("bad_request", "role과 matchId가 필요합니다", seq);
    return;
  }
  if (!payload["role"].is_string() || !payload["matchId"].is_string()) {
    SendError("bad_request", "필드 형식이 올바르지 않습니다", seq);
    return;
  }
  auto match_id = payload["matchId"].get<std::string>();
  if (match_id.empty()) {
    SendError("bad_request", "matchId가 비어 있습니다", seq);
    return;
  }
  session_manager_->Join(session_, ParseRole(payload["role"].get<std::string>()), match_id);
}

void WebSocketSession::HandlePaddle(const nlohmann::json& payload, std::uint64_t seq) {
  if (!payload.contains("y") || !payload["y"].is_number()) {
    SendError("bad_request", "y는 숫자여야 합니다", seq);
    return;
  }
  session_manager_->SubmitPaddleInput(session_, payload["y"].get<double>());
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  EnqueueMessage(MakeErrorFrame(code, message, seq));
}

void WebSocketSession::SendServerEvent(const std::string& event, const nlohmann::json& payload) {
  auto message = MakeEventFrame(event, payload);
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    Disconnect();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  send_queue_.clear();
  queued_bytes_ = 0;
  if (observability_) {
    observability_->Log(LogContext{observability_->NextTraceId(), session_.connection_id, session_.match_id,
                                   "connection.backpressure_close", 0, LogLevel::kWarn});
  }
  Disconnect();
  // 진행 중인 쓰기가 끝나기 전에 close 프레임을 보낼 수 없으므로 소켓을 닫는다.
  if (writing_) {
    boost::beast::get_lowest_layer(ws_).close();
    return;
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::Disconnect() {
  if (disconnected_) {
    return;
  }
  disconnected_ = true;
  if (observability_) {
    observability_->Log(LogContext{observability_->NextTraceId(), session_.connection_id, session_.match_id,
                                   "connection.close", 0, LogLevel::kInfo});
  }
  session_manager_->OnDisconnect(session_);
}

}  // namespace pong
