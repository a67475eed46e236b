#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "pong/app.hpp"

namespace {

constexpr int kMaxFramesToScan = 600;

pong::AppConfig TestConfig(unsigned short port) {
  pong::AppConfig cfg{};
  cfg.port = port;
  cfg.static_root = "public";
  cfg.log_level = "warn";
  cfg.http_read_timeout_seconds = 30;
  cfg.ws_queue_limit_messages = 4096;
  cfg.ws_queue_limit_bytes = 8 * 1024 * 1024;
  cfg.tick_interval_us = 16667;
  cfg.match_rng_seed = 42;
  cfg.broadcast_state_to_all = false;
  return cfg;
}

void ExpectWsEventEnvelope(const nlohmann::json& msg, const std::string& event_name) {
  ASSERT_TRUE(msg.is_object());
  EXPECT_EQ(msg["t"], "event");
  ASSERT_TRUE(msg.contains("seq"));
  EXPECT_EQ(msg["event"], event_name);
  ASSERT_TRUE(msg.contains("p"));
  EXPECT_TRUE(msg["p"].is_object());
}

void ExpectWsError(const nlohmann::json& msg, const std::string& code) {
  ASSERT_TRUE(msg.is_object());
  EXPECT_EQ(msg["t"], "error");
  ASSERT_TRUE(msg.contains("p"));
  EXPECT_EQ(msg["p"]["code"], code);
}

class WsClient {
 public:
  WsClient(boost::asio::io_context& ioc, unsigned short port) : ws_(ioc) {
    boost::asio::ip::tcp::resolver resolver{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(port));
    boost::beast::get_lowest_layer(ws_).connect(results);
    ws_.handshake("127.0.0.1", "/");
  }

  ~WsClient() {
    boost::beast::error_code ec;
    ws_.close(boost::beast::websocket::close_code::normal, ec);
  }

  void SendRaw(const std::string& text) {
    ws_.text(true);
    ws_.write(boost::asio::buffer(text));
  }

  void SendEvent(const std::string& event, const nlohmann::json& payload, std::uint64_t seq = 1) {
    SendRaw(nlohmann::json{{"t", "event"}, {"seq", seq}, {"event", event}, {"p", payload}}.dump());
  }

  nlohmann::json Read() {
    boost::beast::flat_buffer buffer;
    ws_.read(buffer);
    return nlohmann::json::parse(boost::beast::buffers_to_string(buffer.data()));
  }

  // 조건을 만족하는 프레임이 올 때까지 읽는다. 찾지 못하면 null을 반환한다.
  template <typename Predicate>
  nlohmann::json ReadUntil(Predicate predicate) {
    for (int i = 0; i < kMaxFramesToScan; ++i) {
      auto msg = Read();
      if (predicate(msg)) {
        return msg;
      }
    }
    return nullptr;
  }

  nlohmann::json ReadUntilEvent(const std::string& event_name) {
    return ReadUntil([&event_name](const nlohmann::json& msg) {
      return msg.value("t", "") == "event" && msg.value("event", "") == event_name;
    });
  }

 private:
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
};

class MatchFlowFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = TestConfig(18091);
    app_ = std::make_unique<pong::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  std::unique_ptr<WsClient> Connect() { return std::make_unique<WsClient>(client_ioc_, config_.port); }

  pong::AppConfig config_;
  std::unique_ptr<pong::ServerApp> app_;
  std::thread server_thread_;
  boost::asio::io_context client_ioc_;
};

}  // namespace

TEST_F(MatchFlowFixture, JoinReceivesStateAndPaddleInputIsReflected) {
  auto p1 = Connect();
  p1->SendEvent("join", {{"role", "p1"}, {"matchId", "flow-abc"}});

  auto first = p1->Read();
  ExpectWsEventEnvelope(first, "state");
  EXPECT_EQ(first["p"]["matchId"], "flow-abc");
  EXPECT_DOUBLE_EQ(first["p"]["paddle1Y"].get<double>(), 0.5);
  EXPECT_EQ(first["p"]["score1"], 0);
  EXPECT_EQ(first["p"]["score2"], 0);

  p1->SendEvent("paddle", {{"y", 0.2}}, 2);
  auto moved = p1->ReadUntil([](const nlohmann::json& msg) {
    return msg.value("event", "") == "state" && msg["p"].value("paddle1Y", 0.5) == 0.2;
  });
  ASSERT_FALSE(moved.is_null());
  EXPECT_DOUBLE_EQ(moved["p"]["paddle2Y"].get<double>(), 0.5);

  p1->SendEvent("paddle", {{"y", 3.0}}, 3);
  auto clamped = p1->ReadUntil([](const nlohmann::json& msg) {
    return msg.value("event", "") == "state" && msg["p"].value("paddle1Y", 0.5) == 1.0;
  });
  EXPECT_FALSE(clamped.is_null());
}

TEST_F(MatchFlowFixture, HostEndNotifiesPlayersAndBlocksLateJoin) {
  auto host = Connect();
  auto p2 = Connect();
  host->SendEvent("join", {{"role", "host"}, {"matchId", "flow-end"}});
  p2->SendEvent("join", {{"role", "p2"}, {"matchId", "flow-end"}});
  ASSERT_FALSE(host->ReadUntilEvent("state").is_null());
  ASSERT_FALSE(p2->ReadUntilEvent("state").is_null());

  p2->SendEvent("endMatch", nlohmann::json::object(), 2);
  host->SendEvent("endMatch", nlohmann::json::object(), 3);

  auto host_end = host->ReadUntilEvent("matchEnded");
  ASSERT_FALSE(host_end.is_null());
  EXPECT_EQ(host_end["p"]["matchId"], "flow-end");
  auto p2_end = p2->ReadUntilEvent("matchEnded");
  ASSERT_FALSE(p2_end.is_null());
  EXPECT_EQ(p2_end["p"]["matchId"], "flow-end");

  auto late = Connect();
  late->SendEvent("join", {{"role", "p1"}, {"matchId", "flow-end"}});
  auto first = late->Read();
  ExpectWsEventEnvelope(first, "matchEnded");
  EXPECT_EQ(first["p"]["matchId"], "flow-end");

  EXPECT_TRUE(app_->GetMatchRegistry()->IsEnded("flow-end"));
  EXPECT_FALSE(app_->GetMatchRegistry()->Get("flow-end").has_value());
}

TEST_F(MatchFlowFixture, MalformedFramesGetBadRequest) {
  auto client = Connect();

  client->SendRaw("not json");
  ExpectWsError(client->Read(), "bad_request");

  client->SendEvent("teleport", {{"x", 1}}, 9);
  auto unknown = client->Read();
  ExpectWsError(unknown, "bad_request");
  EXPECT_EQ(unknown["seq"], 9);

  client->SendEvent("join", {{"role", "p1"}}, 10);
  ExpectWsError(client->Read(), "bad_request");

  client->SendEvent("paddle", {{"y", "high"}}, 11);
  ExpectWsError(client->Read(), "bad_request");
}

TEST_F(MatchFlowFixture, MatchesAreIsolated) {
  auto a = Connect();
  auto b = Connect();
  a->SendEvent("join", {{"role", "p1"}, {"matchId", "flow-a"}});
  b->SendEvent("join", {{"role", "p1"}, {"matchId", "flow-b"}});

  a->SendEvent("paddle", {{"y", 0.9}}, 2);
  ASSERT_FALSE(a->ReadUntil([](const nlohmann::json& msg) {
                  return msg.value("event", "") == "state" && msg["p"].value("paddle1Y", 0.5) == 0.9;
                }).is_null());

  for (int i = 0; i < 20; ++i) {
    auto msg = b->Read();
    ASSERT_EQ(msg["event"], "state");
    EXPECT_EQ(msg["p"]["matchId"], "flow-b");
    EXPECT_DOUBLE_EQ(msg["p"]["paddle1Y"].get<double>(), 0.5);
  }
}
