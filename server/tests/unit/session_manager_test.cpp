#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "chessroom/chess_rules.hpp"
#include "chessroom/session_manager.hpp"

namespace {

using chessroom::JoinRequest;
using chessroom::MoveStatus;
using chessroom::Seat;
using chessroom::SeatPreference;

class FakeConnection : public chessroom::ClientConnection {
 public:
  bool Send(std::string message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(nlohmann::json::parse(message));
    return true;
  }

  std::vector<nlohmann::json> Messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<nlohmann::json> messages_;
};

class RecordingSink : public chessroom::GameResultSink {
 public:
  bool RecordFinishedGame(const chessroom::GameRecord& record) override {
    if (fail) {
      throw chessroom::DbException("connection refused", 2003, true);
    }
    records.push_back(record);
    return record.white_user_id && record.black_user_id;
  }

  bool fail{false};
  std::vector<chessroom::GameRecord> records;
};

class SessionManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    observability_ = std::make_shared<chessroom::Observability>(chessroom::LogLevel::kDebug, log_);
    registry_ = std::make_shared<chessroom::RoomRegistry>(std::make_shared<chessroom::ChessRules>());
    hub_ = std::make_shared<chessroom::ConnectionHub>();
    hub_->SetObservability(observability_);
    sink_ = std::make_shared<RecordingSink>();
    manager_ = std::make_shared<chessroom::SessionManager>(registry_, hub_, sink_, observability_);
  }

  static JoinRequest Player(SeatPreference preference, std::optional<int> user_id = std::nullopt,
                            std::optional<std::string> username = std::nullopt) {
    JoinRequest request;
    request.preference = preference;
    request.user_id = user_id;
    request.username = std::move(username);
    return request;
  }

  std::ostringstream log_;
  std::shared_ptr<chessroom::Observability> observability_;
  std::shared_ptr<chessroom::RoomRegistry> registry_;
  std::shared_ptr<chessroom::ConnectionHub> hub_;
  std::shared_ptr<RecordingSink> sink_;
  std::shared_ptr<chessroom::SessionManager> manager_;
};

TEST_F(SessionManagerTest, ConnectSendsInitialStateToJoinerOnly) {
  auto white = std::make_shared<FakeConnection>();
  auto black = std::make_shared<FakeConnection>();
  auto white_id = manager_->NextConnectionId();
  auto black_id = manager_->NextConnectionId();
  EXPECT_NE(white_id, black_id);

  EXPECT_EQ(manager_->Connect("R1", white_id, Player(SeatPreference::kWhite), white), Seat::kWhite);
  EXPECT_EQ(manager_->Connect("R1", black_id, Player(SeatPreference::kAny), black), Seat::kBlack);

  auto white_messages = white->Messages();
  ASSERT_EQ(white_messages.size(), 1u);
  EXPECT_EQ(white_messages[0]["type"], "state");
  EXPECT_EQ(white_messages[0]["color"], "w");
  EXPECT_EQ(white_messages[0]["fen"], std::string(chessroom::Position::kStartFen));

  auto black_messages = black->Messages();
  ASSERT_EQ(black_messages.size(), 1u);
  EXPECT_EQ(black_messages[0]["color"], "b");
  EXPECT_EQ(hub_->RoomConnections("R1"), 2u);
}

TEST_F(SessionManagerTest, InvalidUtf8RoomAndNameStillJoinAndPlay) {
  auto white = std::make_shared<FakeConnection>();
  auto black = std::make_shared<FakeConnection>();
  const std::string room_id = "\xFF\xFE";

  ASSERT_NO_THROW(manager_->Connect(room_id, 1, Player(SeatPreference::kWhite, 5, std::string("\xC3")), white));
  ASSERT_NO_THROW(manager_->Connect(room_id, 2, Player(SeatPreference::kAny), black));
  EXPECT_EQ(manager_->SubmitMove(room_id, 1, "e2e4").status, MoveStatus::kApplied);

  EXPECT_EQ(white->Messages().size(), 2u);
  EXPECT_EQ(black->Messages().size(), 2u);
  EXPECT_EQ(black->Messages().back()["last_move"], "e2e4");
  EXPECT_NE(log_.str().find("\xEF\xBF\xBD"), std::string::npos);
}

TEST_F(SessionManagerTest, RejectedMoveIsNotBroadcast) {
  auto white = std::make_shared<FakeConnection>();
  auto black = std::make_shared<FakeConnection>();
  manager_->Connect("R1", 1, Player(SeatPreference::kWhite), white);
  manager_->Connect("R1", 2, Player(SeatPreference::kBlack), black);

  auto result = manager_->SubmitMove("R1", 2, "e7e5");
  EXPECT_EQ(result.status, MoveStatus::kNotYourTurn);
  EXPECT_EQ(white->Messages().size(), 1u);
  EXPECT_EQ(black->Messages().size(), 1u);

  auto unknown_room = manager_->SubmitMove("nowhere", 1, "e2e4");
  EXPECT_EQ(unknown_room.status, MoveStatus::kNotSeated);
  EXPECT_EQ(registry_->Count(), 1u);
}

TEST_F(SessionManagerTest, FullGameBroadcastsPerSeatAndRecordsOnce) {
  auto white = std::make_shared<FakeConnection>();
  auto black = std::make_shared<FakeConnection>();
  auto watcher = std::make_shared<FakeConnection>();
  manager_->Connect("R1", 1, Player(SeatPreference::kWhite, 10, std::string("alice")), white);
  manager_->Connect("R1", 2, Player(SeatPreference::kBlack, 20, std::string("bob")), black);
  manager_->Connect("R1", 3, Player(SeatPreference::kAny), watcher);

  const std::vector<std::pair<chessroom::ConnectionId, std::string>> script{
      {1, "f2f3"}, {2, "e7e5"}, {1, "g2g4"}, {2, "d8h4"}};
  for (const auto& [connection, move] : script) {
    auto result = manager_->SubmitMove("R1", connection, move);
    ASSERT_TRUE(result.Accepted()) << move << ": " << result.error_message;
  }

  const std::vector<std::pair<std::shared_ptr<FakeConnection>, std::string>> expectations{
      {white, "w"}, {black, "b"}, {watcher, "spectator"}};
  for (const auto& [client, color] : expectations) {
    auto messages = client->Messages();
    ASSERT_EQ(messages.size(), 5u);
    for (const auto& message : messages) {
      EXPECT_EQ(message["color"], color);
    }
    const auto& last = messages.back();
    EXPECT_EQ(last["last_move"], "d8h4");
    EXPECT_EQ(last["game_over"], true);
    EXPECT_EQ(last["result"], "black");
    EXPECT_EQ(last["reason"], "checkmate");
    EXPECT_FALSE(messages[3].contains("game_over"));
  }

  ASSERT_EQ(sink_->records.size(), 1u);
  const auto& record = sink_->records.front();
  EXPECT_EQ(record.room_id, "R1");
  EXPECT_EQ(record.moves, "f2f3 e7e5 g2g4 d8h4");
  EXPECT_EQ(record.white_user_id, std::optional<int>(10));
  EXPECT_EQ(record.black_user_id, std::optional<int>(20));
  EXPECT_EQ(record.game_id, registry_->Find("R1")->GameId());

  auto late = manager_->SubmitMove("R1", 1, "a2a3");
  EXPECT_EQ(late.status, MoveStatus::kGameFinished);
  EXPECT_EQ(sink_->records.size(), 1u);

  auto metrics = observability_->Snapshot(registry_->Count());
  EXPECT_EQ(metrics.moves_applied, 4u);
  EXPECT_EQ(metrics.games_finished, 1u);
  EXPECT_EQ(metrics.finalize_failures, 0u);
  EXPECT_EQ(metrics.websocket_active, 3u);
}

TEST_F(SessionManagerTest, FinalizeFailureIsLoggedAndCounted) {
  sink_->fail = true;
  auto white = std::make_shared<FakeConnection>();
  auto black = std::make_shared<FakeConnection>();
  manager_->Connect("R9", 1, Player(SeatPreference::kWhite), white);
  manager_->Connect("R9", 2, Player(SeatPreference::kBlack), black);

  for (const auto& [connection, move] : std::vector<std::pair<chessroom::ConnectionId, std::string>>{
           {1, "f2f3"}, {2, "e7e5"}, {1, "g2g4"}, {2, "d8h4"}}) {
    ASSERT_TRUE(manager_->SubmitMove("R9", connection, move).Accepted());
  }

  EXPECT_TRUE(sink_->records.empty());
  auto metrics = observability_->Snapshot(registry_->Count());
  EXPECT_EQ(metrics.finalize_failures, 1u);
  EXPECT_EQ(metrics.games_finished, 0u);
  EXPECT_NE(log_.str().find("game.finalize_failed"), std::string::npos);
  EXPECT_EQ(white->Messages().back()["game_over"], true);
  EXPECT_TRUE(registry_->Find("R9")->Finished());
}

TEST_F(SessionManagerTest, DisconnectFreesSeatAndUnregisters) {
  auto first = std::make_shared<FakeConnection>();
  auto second = std::make_shared<FakeConnection>();
  auto third = std::make_shared<FakeConnection>();
  manager_->Connect("R1", 1, Player(SeatPreference::kAny, 5, std::string("eve")), first);
  manager_->Connect("R1", 2, Player(SeatPreference::kAny), second);
  EXPECT_EQ(hub_->OnlineUsers().size(), 1u);

  manager_->Disconnect("R1", 1);
  EXPECT_EQ(hub_->RoomConnections("R1"), 1u);
  EXPECT_TRUE(hub_->OnlineUsers().empty());
  EXPECT_EQ(manager_->Connect("R1", 3, Player(SeatPreference::kAny), third), Seat::kWhite);

  manager_->SubmitMove("R1", 3, "e2e4");
  EXPECT_TRUE(first->Messages().size() == 1u);
  EXPECT_EQ(second->Messages().back()["last_move"], "e2e4");
}

}  // namespace
