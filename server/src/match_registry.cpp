/*
 * 설명: 매치 상태 맵과 종료 집합을 관리한다. 레지스트리 잠금은 조회/삽입에만, 매치 잠금은 상태 변경에만 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_registry_test.cpp
 */
#include "pong/match_registry.hpp"

namespace pong {

MatchRegistry::MatchRegistry(std::uint64_t rng_seed) : rng_seed_(rng_seed) {}

bool MatchRegistry::EnsureCreated(const std::string& match_id, std::chrono::steady_clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ended_.count(match_id) > 0 || matches_.count(match_id) > 0) {
    return false;
  }
  auto entry = std::make_shared<Entry>();
  entry->record.rng.seed(rng_seed_ ^ std::hash<std::string>{}(match_id));
  entry->record.state = MakeInitialMatchState(entry->record.rng);
  entry->record.last_tick = now;
  matches_.emplace(match_id, std::move(entry));
  return true;
}

bool MatchRegistry::IsEnded(const std::string& match_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ended_.count(match_id) > 0;
}

bool MatchRegistry::MarkEnded(const std::string& match_id) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ended_.insert(match_id).second) {
      return false;
    }
    auto it = matches_.find(match_id);
    if (it != matches_.end()) {
      entry = std::move(it->second);
      matches_.erase(it);
    }
  }
  // 진행 중인 틱이 이미 엔트리를 잡고 있을 수 있으므로 플래그도 내린다.
  if (entry) {
    std::lock_guard<std::mutex> entry_lock(entry->mutex);
    entry->ended = true;
  }
  return true;
}

std::optional<MatchState> MatchRegistry::Get(const std::string& match_id) const {
  auto entry = Find(match_id);
  if (!entry) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->ended) {
    return std::nullopt;
  }
  return entry->record.state;
}

std::vector<std::string> MatchRegistry::AllActiveIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(matches_.size());
  for (const auto& entry : matches_) {
    ids.push_back(entry.first);
  }
  return ids;
}

bool MatchRegistry::Mutate(const std::string& match_id, const std::function<void(MatchRecord&)>& fn) {
  auto entry = Find(match_id);
  if (!entry) {
    return false;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->ended) {
    return false;
  }
  fn(entry->record);
  return true;
}

std::size_t MatchRegistry::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return matches_.size();
}

std::size_t MatchRegistry::EndedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ended_.size();
}

std::shared_ptr<MatchRegistry::Entry> MatchRegistry::Find(const std::string& match_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = matches_.find(match_id);
  if (it == matches_.end()) {
    return nullptr;
  }
  return it->second;
}

}  // namespace pong
