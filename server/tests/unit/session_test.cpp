#include <gtest/gtest.h>

#include <thread>

#include "gameroom/connect_four.hpp"
#include "gameroom/session.hpp"
#include "test_support.hpp"

using gameroom::JoinMode;
using gameroom::Role;
using testsupport::FakeConnection;
using testsupport::ScriptedEngine;

namespace {

struct SessionFixture {
  explicit SessionFixture(std::unique_ptr<gameroom::GameEngine> engine = std::make_unique<gameroom::ConnectFour>()) {
    session = std::make_shared<gameroom::Session>(
        "session-test", "join-token", "watch-token", std::move(engine),
        std::make_shared<gameroom::Observability>(gameroom::LogLevel::kError),
        [this](const gameroom::Session&) { ++released; });
  }

  std::shared_ptr<gameroom::Session> session;
  int released{0};
};

}  // namespace

TEST(SessionTest, AssignsFirstAvailablePlayerSlotThenSpectator) {
  SessionFixture f;
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto c = std::make_shared<FakeConnection>();

  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_b = f.session->Attach(b, JoinMode::kPlay);
  auto att_c = f.session->Attach(c, JoinMode::kPlay);

  ASSERT_TRUE(att_a && att_b && att_c);
  EXPECT_EQ(att_a->GetRole(), Role::kPlayer1);
  EXPECT_EQ(att_b->GetRole(), Role::kPlayer2);
  EXPECT_EQ(att_c->GetRole(), Role::kSpectator);
  EXPECT_EQ(f.session->CountRole(Role::kPlayer1), 1u);
  EXPECT_EQ(f.session->CountRole(Role::kPlayer2), 1u);
  EXPECT_EQ(f.session->AttachedCount(), 3u);
}

TEST(SessionTest, WatchModeIsAlwaysSpectator) {
  SessionFixture f;
  auto watcher = std::make_shared<FakeConnection>();
  auto attachment = f.session->Attach(watcher, JoinMode::kWatch);
  ASSERT_TRUE(attachment);
  EXPECT_EQ(attachment->GetRole(), Role::kSpectator);
  EXPECT_EQ(f.session->CountRole(Role::kPlayer1), 0u);
}

TEST(SessionTest, FreedPlayerSlotGoesToNextJoiner) {
  SessionFixture f;
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto c = std::make_shared<FakeConnection>();
  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_b = f.session->Attach(b, JoinMode::kPlay);

  att_a.reset();
  EXPECT_EQ(f.session->CountRole(Role::kPlayer1), 0u);
  EXPECT_EQ(f.released, 0);

  auto att_c = f.session->Attach(c, JoinMode::kPlay);
  ASSERT_TRUE(att_c);
  EXPECT_EQ(att_c->GetRole(), Role::kPlayer1);
  EXPECT_EQ(att_b->GetRole(), Role::kPlayer2);
}

TEST(SessionTest, DetachIsIdempotentAndReleasesOnceWhenEmpty) {
  SessionFixture f;
  auto a = std::make_shared<FakeConnection>();
  auto attachment = f.session->Attach(a, JoinMode::kPlay);

  f.session->Detach(a.get());
  f.session->Detach(a.get());
  attachment.reset();

  EXPECT_EQ(f.released, 1);
  EXPECT_TRUE(f.session->IsClosed());
  EXPECT_FALSE(f.session->Attach(std::make_shared<FakeConnection>(), JoinMode::kPlay));
}

TEST(SessionTest, SameConnectionCannotAttachTwice) {
  SessionFixture f;
  auto a = std::make_shared<FakeConnection>();
  auto first = f.session->Attach(a, JoinMode::kPlay);
  EXPECT_FALSE(f.session->Attach(a, JoinMode::kPlay));
  EXPECT_EQ(f.session->AttachedCount(), 1u);
}

TEST(SessionTest, SuccessfulMoveIsBroadcastToAll) {
  SessionFixture f;
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto watcher = std::make_shared<FakeConnection>();
  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_b = f.session->Attach(b, JoinMode::kPlay);
  auto att_w = f.session->Attach(watcher, JoinMode::kWatch);

  auto result = f.session->ApplyMove(Role::kPlayer1, 3);

  ASSERT_TRUE(result.accepted);
  EXPECT_EQ(result.row, 0);
  EXPECT_FALSE(result.terminal);
  nlohmann::json expected{{"type", "play"}, {"player", "Player1"}, {"column", 3}, {"row", 0}};
  EXPECT_EQ(a->Last(), expected);
  EXPECT_EQ(b->Last(), expected);
  EXPECT_EQ(watcher->Last(), expected);
}

TEST(SessionTest, IllegalMoveIsNotBroadcastAndLeavesStateUnchanged) {
  SessionFixture f;
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_b = f.session->Attach(b, JoinMode::kPlay);

  auto result = f.session->ApplyMove(Role::kPlayer2, 3);

  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.code, gameroom::errors::kIllegalMove);
  EXPECT_EQ(result.reason, "It isn't your turn.");
  EXPECT_TRUE(a->Messages().empty());
  EXPECT_TRUE(b->Messages().empty());

  auto next = f.session->ApplyMove(Role::kPlayer1, 3);
  ASSERT_TRUE(next.accepted);
  EXPECT_EQ(next.row, 0);
}

TEST(SessionTest, SpectatorCannotMove) {
  SessionFixture f;
  auto result = f.session->ApplyMove(Role::kSpectator, 0);
  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.reason, "Spectators cannot play.");
}

TEST(SessionTest, EngineFaultKeepsSessionUsable) {
  SessionFixture f(std::make_unique<ScriptedEngine>());
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_b = f.session->Attach(b, JoinMode::kPlay);

  auto fault = f.session->ApplyMove(Role::kPlayer1, ScriptedEngine::kFaultColumn);
  EXPECT_FALSE(fault.accepted);
  EXPECT_EQ(fault.code, gameroom::errors::kEngineFault);
  EXPECT_TRUE(b->Messages().empty());

  auto next = f.session->ApplyMove(Role::kPlayer2, 1);
  EXPECT_TRUE(next.accepted);
  EXPECT_FALSE(f.session->IsClosed());
}

TEST(SessionTest, WinningMoveBroadcastsWinThenTearsDown) {
  SessionFixture f(std::make_unique<ScriptedEngine>(2));
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_b = f.session->Attach(b, JoinMode::kPlay);

  ASSERT_TRUE(f.session->ApplyMove(Role::kPlayer1, 3).accepted);
  auto result = f.session->ApplyMove(Role::kPlayer1, 3);

  ASSERT_TRUE(result.accepted);
  EXPECT_TRUE(result.terminal);
  for (const auto& connection : {a, b}) {
    auto messages = connection->Messages();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[1], (nlohmann::json{{"type", "play"}, {"player", "Player1"}, {"column", 3}, {"row", 1}}));
    EXPECT_EQ(messages[2], (nlohmann::json{{"type", "win"}, {"player", "Player1"}}));
    EXPECT_TRUE(connection->IsClosed());
  }
  EXPECT_EQ(f.released, 1);
  EXPECT_TRUE(f.session->IsFinished());
  EXPECT_EQ(f.session->AttachedCount(), 0u);

  auto after = f.session->ApplyMove(Role::kPlayer2, 0);
  EXPECT_FALSE(after.accepted);
  EXPECT_EQ(after.reason, "Game is over.");

  att_a.reset();
  att_b.reset();
  EXPECT_EQ(f.released, 1);
}

TEST(SessionTest, LateJoinerReceivesReplayBeforeNewMoves) {
  SessionFixture f;
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_b = f.session->Attach(b, JoinMode::kPlay);
  ASSERT_TRUE(f.session->ApplyMove(Role::kPlayer1, 3).accepted);
  ASSERT_TRUE(f.session->ApplyMove(Role::kPlayer2, 4).accepted);

  auto watcher = std::make_shared<FakeConnection>();
  auto att_w = f.session->Attach(watcher, JoinMode::kWatch);
  ASSERT_TRUE(f.session->ApplyMove(Role::kPlayer1, 3).accepted);

  auto messages = watcher->Messages();
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(messages[0]["column"], 3);
  EXPECT_EQ(messages[1]["player"], "Player2");
  EXPECT_EQ(messages[2]["row"], 1);
}

TEST(SessionTest, BroadcastRespectsRoleFilter) {
  SessionFixture f;
  auto a = std::make_shared<FakeConnection>();
  auto watcher = std::make_shared<FakeConnection>();
  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_w = f.session->Attach(watcher, JoinMode::kWatch);

  f.session->Broadcast(gameroom::ErrorEvent{"players only"}, {Role::kPlayer1, Role::kPlayer2});
  f.session->Broadcast(gameroom::ErrorEvent{"everyone"});

  EXPECT_EQ(a->Messages().size(), 2u);
  ASSERT_EQ(watcher->Messages().size(), 1u);
  EXPECT_EQ(watcher->Last()["message"], "everyone");
}

TEST(SessionTest, SpectatorLeavingDoesNotAffectDelivery) {
  SessionFixture f;
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_b = f.session->Attach(b, JoinMode::kPlay);
  auto watcher = std::make_shared<FakeConnection>();
  auto att_w = f.session->Attach(watcher, JoinMode::kWatch);

  att_w.reset();
  watcher.reset();
  ASSERT_TRUE(f.session->ApplyMove(Role::kPlayer1, 0).accepted);

  EXPECT_EQ(a->Messages().size(), 1u);
  EXPECT_EQ(b->Messages().size(), 1u);
}

TEST(SessionTest, BrokenConnectionDoesNotBlockOthers) {
  SessionFixture f;
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_b = f.session->Attach(b, JoinMode::kPlay);
  b->FailSends(true);

  auto result = f.session->ApplyMove(Role::kPlayer1, 0);

  EXPECT_TRUE(result.accepted);
  EXPECT_EQ(a->Messages().size(), 1u);
  EXPECT_TRUE(b->IsClosed());
}

TEST(SessionTest, ConcurrentMovesAreSerializedInBroadcastOrder) {
  auto probe = std::make_shared<testsupport::EngineProbe>();
  SessionFixture f(std::make_unique<ScriptedEngine>(0, probe, std::chrono::microseconds(200)));
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto watcher = std::make_shared<FakeConnection>();
  auto att_a = f.session->Attach(a, JoinMode::kPlay);
  auto att_b = f.session->Attach(b, JoinMode::kPlay);
  auto att_w = f.session->Attach(watcher, JoinMode::kWatch);

  constexpr int kMovesPerPlayer = 40;
  auto submit = [&f](Role role) {
    for (int i = 0; i < kMovesPerPlayer; ++i) {
      EXPECT_TRUE(f.session->ApplyMove(role, 0).accepted);
    }
  };
  std::thread t1(submit, Role::kPlayer1);
  std::thread t2(submit, Role::kPlayer2);
  t1.join();
  t2.join();

  EXPECT_FALSE(probe->overlapped.load());
  EXPECT_EQ(probe->calls.load(), 2 * kMovesPerPlayer);

  // 모든 수가 같은 열에 쌓이므로 행 번호가 적용 순서가 된다.
  auto seen_by_a = a->Messages();
  ASSERT_EQ(seen_by_a.size(), static_cast<std::size_t>(2 * kMovesPerPlayer));
  for (std::size_t i = 0; i < seen_by_a.size(); ++i) {
    EXPECT_EQ(seen_by_a[i]["row"], static_cast<int>(i));
  }
  EXPECT_EQ(b->Messages(), seen_by_a);
  EXPECT_EQ(watcher->Messages(), seen_by_a);
}
