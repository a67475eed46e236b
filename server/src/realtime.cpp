/*
 * 설명: 연결별 이벤트 싱크를 관리하고 연결/매치/전체 단위로 서버 이벤트를 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_manager_test.cpp, server/tests/e2e/match_flow_test.cpp
 */
#include "pong/realtime.hpp"

namespace pong {

void RealtimeCoordinator::Register(ConnectionId connection_id, const std::shared_ptr<EventSink>& sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[connection_id] = Entry{sink, std::nullopt};
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

void RealtimeCoordinator::Unregister(ConnectionId connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connections_.erase(connection_id) > 0 && observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

void RealtimeCoordinator::Associate(ConnectionId connection_id, const std::string& match_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return;
  }
  it->second.match_id = match_id;
}

void RealtimeCoordinator::SendEventToConnection(ConnectionId connection_id, const std::string& event,
                                                const nlohmann::json& payload) {
  std::shared_ptr<EventSink> sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return;
    }
    sink = it->second.sink.lock();
  }
  if (sink) {
    sink->SendServerEvent(event, payload);
  }
}

std::size_t RealtimeCoordinator::SendEventToMatch(const std::string& match_id, const std::string& event,
                                                  const nlohmann::json& payload) {
  auto sinks = CollectSinks([&match_id](const Entry& entry) { return entry.match_id == match_id; });
  for (const auto& sink : sinks) {
    sink->SendServerEvent(event, payload);
  }
  return sinks.size();
}

void RealtimeCoordinator::SendEventToAll(const std::string& event, const nlohmann::json& payload) {
  auto sinks = CollectSinks([](const Entry&) { return true; });
  for (const auto& sink : sinks) {
    sink->SendServerEvent(event, payload);
  }
}

std::size_t RealtimeCoordinator::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::vector<std::shared_ptr<EventSink>> RealtimeCoordinator::CollectSinks(
    const std::function<bool(const Entry&)>& filter) const {
  std::vector<std::shared_ptr<EventSink>> sinks;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : connections_) {
    if (!filter(entry.second)) {
      continue;
    }
    if (auto sink = entry.second.sink.lock()) {
      sinks.push_back(std::move(sink));
    }
  }
  return sinks;
}

}  // namespace pong
