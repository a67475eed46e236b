#include <string>

#include <gtest/gtest.h>

#include "pong/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = pong::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = pong::MakeErrorEnvelope("not_found", "파일 없음");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "not_found");
  EXPECT_EQ(env["error"]["message"], "파일 없음");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, EventFrameShape) {
  auto frame = nlohmann::json::parse(pong::MakeEventFrame("matchEnded", {{"matchId", "abc"}}));
  EXPECT_EQ(frame["t"], "event");
  EXPECT_EQ(frame["event"], "matchEnded");
  EXPECT_EQ(frame["seq"], 0);
  EXPECT_EQ(frame["p"]["matchId"], "abc");
}

TEST(JsonEnvelopeTest, ErrorFrameEchoesSeq) {
  auto frame = nlohmann::json::parse(pong::MakeErrorFrame("bad_request", "잘못된 요청", 7));
  EXPECT_EQ(frame["t"], "error");
  EXPECT_TRUE(frame["event"].is_null());
  EXPECT_EQ(frame["seq"], 7);
  EXPECT_EQ(frame["p"]["code"], "bad_request");
}

TEST(ClientFrameTest, ParsesJoinEvent) {
  pong::WsEnvelope env;
  std::string error;
  ASSERT_TRUE(pong::ParseClientFrame(R"({"t":"event","seq":3,"event":"join","p":{"role":"p1","matchId":"abc"}})",
                                     env, error));
  EXPECT_EQ(env.event, "join");
  EXPECT_EQ(env.seq, 3u);
  EXPECT_EQ(env.payload["role"], "p1");
  EXPECT_EQ(env.payload["matchId"], "abc");
}

TEST(ClientFrameTest, MissingPayloadBecomesEmptyObject) {
  pong::WsEnvelope env;
  std::string error;
  ASSERT_TRUE(pong::ParseClientFrame(R"({"t":"event","event":"endMatch"})", env, error));
  EXPECT_EQ(env.event, "endMatch");
  EXPECT_EQ(env.seq, 0u);
  EXPECT_TRUE(env.payload.is_object());
  EXPECT_TRUE(env.payload.empty());
}

TEST(ClientFrameTest, RejectsMalformedInput) {
  pong::WsEnvelope env;
  std::string error;
  EXPECT_FALSE(pong::ParseClientFrame("not json", env, error));
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(pong::ParseClientFrame("[1,2,3]", env, error));
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(pong::ParseClientFrame(R"({"t":"ping","seq":4,"event":"join"})", env, error));
  EXPECT_EQ(env.seq, 4u);

  EXPECT_FALSE(pong::ParseClientFrame(R"({"t":"event","p":{}})", env, error));
  EXPECT_FALSE(pong::ParseClientFrame(R"({"t":"event","event":"paddle","p":0.5})", env, error));
}
