/*
 * 설명: HTTP 요청을 헬스/메트릭/정적 파일/WS 업그레이드로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/metrics_static_test.cpp, server/tests/e2e/match_flow_test.cpp, server/tests/e2e/connection_limits_test.cpp
 */
#include "pong/http_session.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string_view>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

namespace pong {

namespace {
constexpr const char* kServerName = "parker-pong";

const char* MimeType(const std::string& path) {
  auto const dot = path.rfind('.');
  if (dot == std::string::npos) {
    return "application/octet-stream";
  }
  auto const ext = std::string_view(path).substr(dot);
  if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
  if (ext == ".css") return "text/css; charset=utf-8";
  if (ext == ".js") return "application/javascript; charset=utf-8";
  if (ext == ".json") return "application/json; charset=utf-8";
  if (ext == ".png") return "image/png";
  if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
  if (ext == ".gif") return "image/gif";
  if (ext == ".svg") return "image/svg+xml";
  if (ext == ".ico") return "image/vnd.microsoft.icon";
  if (ext == ".txt") return "text/plain; charset=utf-8";
  return "application/octet-stream";
}

// 루트를 벗어나는 경로는 거부한다.
std::optional<std::filesystem::path> ResolveStaticPath(const std::string& root, const std::string& target_path) {
  if (target_path.empty() || target_path.front() != '/' || target_path.find("..") != std::string::npos) {
    return std::nullopt;
  }
  std::string relative = target_path.substr(1);
  if (relative.empty() || relative.back() == '/') {
    relative += "index.html";
  }
  return std::filesystem::path(root) / relative;
}

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) {
    return std::nullopt;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<RealtimeCoordinator> coordinator,
                         std::shared_ptr<SessionManager> session_manager,
                         std::shared_ptr<MatchRegistry> registry,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), coordinator_(std::move(coordinator)),
      session_manager_(std::move(session_manager)), registry_(std::move(registry)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(config_.http_read_timeout_seconds));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path = std::string(req_.target());
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path = path.substr(0, qpos);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return SendEnvelope(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(registry_->ActiveCount(), registry_->EndedCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"matches", {{"active", snapshot.active_matches}, {"ended", snapshot.ended_matches}}},
                        {"ticks", {{"total", snapshot.ticks_total}, {"errors", snapshot.tick_errors}}}};
    return SendEnvelope(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get) {
    return ServeStatic(path, res);
  }

  SendEnvelope(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::ServeStatic(const std::string& path, const std::shared_ptr<Response>& res) {
  using namespace boost::beast;
  auto file_path = ResolveStaticPath(config_.static_root, path);
  if (!file_path) {
    return SendEnvelope(res, http::status::bad_request, MakeErrorEnvelope("bad_request", "허용되지 않는 경로입니다"));
  }
  auto body = ReadFile(*file_path);
  if (!body) {
    return SendEnvelope(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }
  res->result(http::status::ok);
  res->set(http::field::content_type, MimeType(file_path->string()));
  res->content_length(body->size());
  res->body() = std::move(*body);
  SendResponse(res);
}

void HttpSession::SendEnvelope(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                               const nlohmann::json& envelope) {
  auto body = envelope.dump();
  res->result(status);
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(
        LogContext{trace_id_, std::nullopt, std::nullopt, std::string(req_.target()), latency, LogLevel::kDebug});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  // HTTP 읽기 마감 시간을 지우고 이후에는 websocket 자체 타임아웃만 적용한다.
  boost::beast::get_lowest_layer(ws).expires_never();
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    boost::beast::get_lowest_layer(ws).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), coordinator_, session_manager_, observability_,
                                     config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
      ->Run();
}

}  // namespace pong
