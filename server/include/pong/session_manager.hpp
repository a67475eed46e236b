/*
 * 설명: 연결별 역할/매치 세션을 받아 입장, 패들 입력, 매치 종료, 연결 해제를 매치 레지스트리에 반영한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_manager_test.cpp, server/tests/e2e/match_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "pong/match_registry.hpp"
#include "pong/observability.hpp"
#include "pong/realtime.hpp"

namespace pong {

enum class Role { kHost, kPlayer1, kPlayer2 };

// "host", "p1", "p2" 외의 값은 역할 없음으로 본다.
std::optional<Role> ParseRole(std::string_view value);
std::string_view RoleName(Role role);

// 연결 처리기가 소유하고 SessionManager 호출에 명시적으로 넘긴다.
struct Session {
  ConnectionId connection_id{0};
  std::optional<Role> role;
  std::optional<std::string> match_id;
};

class SessionManager {
 public:
  SessionManager(std::shared_ptr<MatchRegistry> registry, std::shared_ptr<RealtimeCoordinator> coordinator,
                 std::shared_ptr<Observability> observability);

  void Join(Session& session, std::optional<Role> role, const std::string& match_id);
  bool SubmitPaddleInput(const Session& session, double normalized_y);
  bool EndMatch(const Session& session);
  void OnDisconnect(Session& session);

 private:
  void SendMatchEnded(ConnectionId connection_id, const std::string& match_id);
  void LogSessionEvent(const Session& session, const std::string& name, LogLevel level) const;

  std::shared_ptr<MatchRegistry> registry_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace pong
