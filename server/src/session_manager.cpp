/*
 * 설명: 세션 입장/입력/종료/해제를 처리하고 결과 이벤트를 연결 또는 매치 단위로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_manager_test.cpp, server/tests/e2e/match_flow_test.cpp
 */
#include "pong/session_manager.hpp"

#include <algorithm>

namespace pong {

std::optional<Role> ParseRole(std::string_view value) {
  if (value == "host") {
    return Role::kHost;
  }
  if (value == "p1") {
    return Role::kPlayer1;
  }
  if (value == "p2") {
    return Role::kPlayer2;
  }
  return std::nullopt;
}

std::string_view RoleName(Role role) {
  switch (role) {
    case Role::kHost:
      return "host";
    case Role::kPlayer1:
      return "p1";
    case Role::kPlayer2:
      return "p2";
  }
  return "host";
}

SessionManager::SessionManager(std::shared_ptr<MatchRegistry> registry,
                               std::shared_ptr<RealtimeCoordinator> coordinator,
                               std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), coordinator_(std::move(coordinator)),
      observability_(std::move(observability)) {}

void SessionManager::Join(Session& session, std::optional<Role> role, const std::string& match_id) {
  session.role = role;
  session.match_id = match_id;
  coordinator_->Associate(session.connection_id, match_id);

  if (registry_->IsEnded(match_id)) {
    SendMatchEnded(session.connection_id, match_id);
    return;
  }
  if (registry_->EnsureCreated(match_id)) {
    LogSessionEvent(session, "match.created", LogLevel::kInfo);
  }
  // EnsureCreated 직후 호스트가 종료했을 수 있다.
  auto state = registry_->Get(match_id);
  if (!state) {
    SendMatchEnded(session.connection_id, match_id);
    return;
  }
  coordinator_->SendEventToConnection(session.connection_id, "state", ToStatePayload(match_id, *state));
  LogSessionEvent(session, std::string("session.join.") + std::string(role ? RoleName(*role) : "none"),
                  LogLevel::kInfo);
}

bool SessionManager::SubmitPaddleInput(const Session& session, double normalized_y) {
  // 패들은 역할에 묶인 필드 하나만 움직일 수 있다.
  if (!session.match_id || (session.role != Role::kPlayer1 && session.role != Role::kPlayer2)) {
    return false;
  }
  const bool left = session.role == Role::kPlayer1;
  const double clamped = std::clamp(normalized_y, 0.0, 1.0);
  return registry_->Mutate(*session.match_id, [left, clamped](MatchRecord& record) {
    if (left) {
      record.state.paddle1_y = clamped;
    } else {
      record.state.paddle2_y = clamped;
    }
  });
}

bool SessionManager::EndMatch(const Session& session) {
  if (session.role != Role::kHost || !session.match_id) {
    return false;
  }
  const auto& match_id = *session.match_id;
  if (!registry_->MarkEnded(match_id)) {
    return false;
  }
  LogSessionEvent(session, "match.ended", LogLevel::kInfo);
  coordinator_->SendEventToMatch(match_id, "matchEnded", {{"matchId", match_id}});
  return true;
}

void SessionManager::OnDisconnect(Session& session) {
  coordinator_->Unregister(session.connection_id);
  LogSessionEvent(session, "session.disconnect", LogLevel::kDebug);
  session.role.reset();
  session.match_id.reset();
}

void SessionManager::SendMatchEnded(ConnectionId connection_id, const std::string& match_id) {
  coordinator_->SendEventToConnection(connection_id, "matchEnded", {{"matchId", match_id}});
}

void SessionManager::LogSessionEvent(const Session& session, const std::string& name, LogLevel level) const {
  if (!observability_) {
    return;
  }
  observability_->Log(
      LogContext{observability_->NextTraceId(), session.connection_id, session.match_id, name, 0, level});
}

}  // namespace pong
