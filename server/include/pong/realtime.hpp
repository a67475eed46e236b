/*
 * 설명: 연결별 이벤트 싱크와 연결된 매치 ID를 관리하고 서버 측 이벤트 전달을 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_manager_test.cpp, server/tests/e2e/match_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "pong/observability.hpp"

namespace pong {

using ConnectionId = std::uint64_t;

class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void SendServerEvent(const std::string& event, const nlohmann::json& payload) = 0;
};

class RealtimeCoordinator : public std::enable_shared_from_this<RealtimeCoordinator> {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  ConnectionId NextConnectionId() { return next_id_.fetch_add(1); }
  void Register(ConnectionId connection_id, const std::shared_ptr<EventSink>& sink);
  void Unregister(ConnectionId connection_id);
  // 연결이 받을 매치를 바꾼다. 이전 매치의 이벤트는 더 이상 전달되지 않는다.
  void Associate(ConnectionId connection_id, const std::string& match_id);
  void SendEventToConnection(ConnectionId connection_id, const std::string& event, const nlohmann::json& payload);
  // 전달한 연결 수를 반환한다.
  std::size_t SendEventToMatch(const std::string& match_id, const std::string& event, const nlohmann::json& payload);
  void SendEventToAll(const std::string& event, const nlohmann::json& payload);
  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    std::weak_ptr<EventSink> sink;
    std::optional<std::string> match_id;
  };

  std::vector<std::shared_ptr<EventSink>> CollectSinks(const std::function<bool(const Entry&)>& filter) const;

  std::unordered_map<ConnectionId, Entry> connections_;
  std::atomic<ConnectionId> next_id_{1};
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace pong
