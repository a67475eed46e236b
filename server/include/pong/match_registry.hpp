/*
 * 설명: 매치 ID별 시뮬레이션 상태와 종료된 매치 집합을 소유하고 키 단위 잠금으로 접근을 중재한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "pong/match_state.hpp"

namespace pong {

struct MatchRecord {
  MatchState state;
  std::chrono::steady_clock::time_point last_tick;
  std::mt19937_64 rng;
};

class MatchRegistry {
 public:
  explicit MatchRegistry(std::uint64_t rng_seed);

  // 새로 만들었으면 true, 이미 있거나 종료된 ID면 아무 것도 하지 않고 false.
  bool EnsureCreated(const std::string& match_id,
                     std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
  bool IsEnded(const std::string& match_id) const;
  // 이번 호출이 종료 전이를 수행했으면 true.
  bool MarkEnded(const std::string& match_id);
  std::optional<MatchState> Get(const std::string& match_id) const;
  std::vector<std::string> AllActiveIds() const;

  // 해당 매치의 잠금을 잡은 채 fn을 실행한다. 없거나 종료된 매치면 false.
  // fn 안에서 레지스트리를 다시 호출하면 안 된다.
  bool Mutate(const std::string& match_id, const std::function<void(MatchRecord&)>& fn);

  std::size_t ActiveCount() const;
  std::size_t EndedCount() const;

 private:
  struct Entry {
    std::mutex mutex;
    MatchRecord record;
    bool ended{false};
  };

  std::shared_ptr<Entry> Find(const std::string& match_id) const;

  std::uint64_t rng_seed_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> matches_;
  std::unordered_set<std::string> ended_;
  mutable std::mutex mutex_;
};

}  // namespace pong
