#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "pong/game_loop.hpp"
#include "pong/match_registry.hpp"
#include "pong/observability.hpp"
#include "pong/physics.hpp"
#include "pong/realtime.hpp"

namespace {

class CountingSink : public pong::EventSink {
 public:
  void SendServerEvent(const std::string& event, const nlohmann::json& payload) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (event == "state") {
      match_ids_.push_back(payload.value("matchId", ""));
    }
  }

  std::vector<std::string> StateMatchIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return match_ids_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> match_ids_;
};

class GameLoopFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = std::make_shared<pong::MatchRegistry>(5);
    coordinator_ = std::make_shared<pong::RealtimeCoordinator>();
    observability_ = std::make_shared<pong::Observability>(pong::LogLevel::kError);
    engine_ = std::make_shared<pong::PhysicsEngine>(registry_, observability_);
  }

  std::shared_ptr<CountingSink> Attach(const std::string& match_id) {
    auto sink = std::make_shared<CountingSink>();
    auto id = coordinator_->NextConnectionId();
    coordinator_->Register(id, sink);
    if (!match_id.empty()) {
      coordinator_->Associate(id, match_id);
    }
    return sink;
  }

  // 실제 타이머로 루프를 돌린 뒤 멈추고 실행한 틱 수를 돌려준다.
  std::uint64_t RunFor(bool broadcast_to_all, std::chrono::milliseconds duration) {
    boost::asio::io_context ioc;
    auto loop = std::make_shared<pong::GameLoop>(ioc, engine_, coordinator_, observability_,
                                                 std::chrono::milliseconds(20), broadcast_to_all);
    loop->Start();
    std::thread worker([&ioc]() { ioc.run(); });
    std::this_thread::sleep_for(duration);
    loop->Stop();
    ioc.stop();
    worker.join();
    return loop->TickCount();
  }

  std::shared_ptr<pong::MatchRegistry> registry_;
  std::shared_ptr<pong::RealtimeCoordinator> coordinator_;
  std::shared_ptr<pong::Observability> observability_;
  std::shared_ptr<pong::PhysicsEngine> engine_;
};

}  // namespace

TEST_F(GameLoopFixture, TicksAtFixedDelayAndPublishesPerMatch) {
  registry_->EnsureCreated("abc");
  registry_->EnsureCreated("xyz");
  auto subscriber = Attach("abc");
  auto bystander = Attach("");

  auto ticks = RunFor(false, std::chrono::milliseconds(250));

  EXPECT_GE(ticks, 3u);
  EXPECT_LE(ticks, 13u);
  EXPECT_EQ(observability_->Snapshot(0, 0).ticks_total, ticks);

  auto received = subscriber->StateMatchIds();
  EXPECT_GE(received.size(), 3u);
  for (const auto& match_id : received) {
    EXPECT_EQ(match_id, "abc");
  }
  EXPECT_TRUE(bystander->StateMatchIds().empty());
}

TEST_F(GameLoopFixture, GlobalBroadcastReachesEveryConnection) {
  registry_->EnsureCreated("abc");
  auto subscriber = Attach("abc");
  auto bystander = Attach("");

  RunFor(true, std::chrono::milliseconds(150));

  EXPECT_FALSE(bystander->StateMatchIds().empty());
  // 구독자는 매치 전송과 전체 전송을 모두 받는다.
  EXPECT_GE(subscriber->StateMatchIds().size(), 2 * bystander->StateMatchIds().size());
}

TEST_F(GameLoopFixture, EndedMatchStopsPublishing) {
  registry_->EnsureCreated("abc");
  registry_->MarkEnded("abc");
  auto subscriber = Attach("abc");

  auto ticks = RunFor(false, std::chrono::milliseconds(100));

  EXPECT_GT(ticks, 0u);
  EXPECT_TRUE(subscriber->StateMatchIds().empty());
}
