/*
 * 설명: JSON 응답 엔벨로프와 WebSocket 프레임을 생성하고 클라이언트 프레임을 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "pong/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace pong {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

std::string MakeEventFrame(const std::string& event, const nlohmann::json& payload, std::uint64_t seq) {
  WsEnvelope env{.type = "event", .event = event, .seq = seq, .payload = payload};
  return ToWsJson(env).dump();
}

std::string MakeErrorFrame(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  return ToWsJson(env).dump();
}

bool ParseClientFrame(std::string_view raw, WsEnvelope& out, std::string& error_message) {
  out = WsEnvelope{.type = "", .event = "", .seq = 0, .payload = nlohmann::json::object()};
  auto message = nlohmann::json::parse(raw, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    error_message = "JSON 파싱 오류";
    return false;
  }
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    out.seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = message.find("t");
  if (type_it == message.end() || !type_it->is_string() || *type_it != "event") {
    error_message = "알 수 없는 메시지 유형";
    return false;
  }
  auto event_it = message.find("event");
  if (event_it == message.end() || !event_it->is_string()) {
    error_message = "event 필드가 필요합니다";
    return false;
  }
  auto payload_it = message.find("p");
  if (payload_it != message.end() && !payload_it->is_null()) {
    if (!payload_it->is_object()) {
      error_message = "payload 형식이 올바르지 않습니다";
      return false;
    }
    out.payload = *payload_it;
  }
  out.type = "event";
  out.event = event_it->get<std::string>();
  return true;
}

}  // namespace pong
