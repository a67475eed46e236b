/*
 * 설명: HTTP 응답 엔벨로프와 WebSocket 메시지 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace pong {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);
std::string MakeEventFrame(const std::string& event, const nlohmann::json& payload, std::uint64_t seq = 0);
std::string MakeErrorFrame(std::string_view code, std::string_view message, std::uint64_t seq);

// 클라이언트 프레임은 t == "event"와 문자열 event가 필수이고 p가 없으면 빈 객체로 채운다.
// 실패하면 out.seq에 읽어낸 seq를 남기고 error_message를 채운다.
bool ParseClientFrame(std::string_view raw, WsEnvelope& out, std::string& error_message);

}  // namespace pong
