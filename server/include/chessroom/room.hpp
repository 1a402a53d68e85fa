/*
 * 설명: 한 게임의 좌석 배정, 차례 판정, 수 적용과 종료 전이를 단일 뮤텍스로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chessroom/game_record.hpp"
#include "chessroom/rules_engine.hpp"

namespace chessroom {

using ConnectionId = std::uint64_t;

enum class Seat { kWhite, kBlack, kSpectator };

enum class SeatPreference { kAny, kWhite, kBlack };

enum class RoomPhase { kWaiting, kActive, kFinished };

// "w" | "b" | "spectator"
std::string_view ToString(Seat seat);
// "w" | "b", 그 외 값은 kAny
SeatPreference ParseSeatPreference(std::string_view text);

struct JoinRequest {
  std::optional<int> user_id;
  std::optional<std::string> username;
  SeatPreference preference{SeatPreference::kAny};
};

struct AppliedMove {
  std::string fen;
  std::string last_move;
  std::optional<TerminalStatus> terminal;
};

enum class MoveStatus { kApplied, kGameFinished, kNotSeated, kSpectator, kNotYourTurn, kInvalidMove };

struct MoveResult {
  MoveStatus status{MoveStatus::kApplied};
  std::string error_message;
  // 이 수로 게임이 끝났을 때 단 한 번만 채워진다.
  std::optional<GameRecord> finished_game;

  bool Accepted() const { return status == MoveStatus::kApplied; }
};

class Room {
 public:
  // 아래 핸들러는 룸 뮤텍스를 쥔 상태에서 호출되므로 블로킹 작업을 하면 안 된다.
  using SeatedHandler = std::function<void(Seat seat, const std::string& fen)>;
  using CommitHandler = std::function<void(const AppliedMove& applied)>;

  Room(std::string id, std::string game_id, std::shared_ptr<const RulesEngine> rules,
       std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now());

  Room(const Room&) = delete;
  Room& operator=(const Room&) = delete;

  Seat Join(ConnectionId connection, const JoinRequest& request, const SeatedHandler& on_seated = {});
  bool Leave(ConnectionId connection);
  MoveResult SubmitMove(ConnectionId connection, std::string_view move_text, const CommitHandler& on_commit = {});

  const std::string& Id() const { return id_; }
  const std::string& GameId() const { return game_id_; }
  std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }

  std::string Fen() const;
  std::vector<std::string> MoveHistory() const;
  std::optional<Seat> SeatOf(ConnectionId connection) const;
  std::optional<int> WhiteUserId() const;
  std::optional<int> BlackUserId() const;
  std::size_t ConnectionCount() const;
  bool Finished() const;
  RoomPhase Phase() const;

 private:
  Seat PickSeat(SeatPreference preference) const;
  bool IsOccupied(Seat seat) const;
  GameRecord BuildRecord(const TerminalStatus& status) const;
  static MoveResult Reject(MoveStatus status, std::string message);

  const std::string id_;
  const std::string game_id_;
  std::shared_ptr<const RulesEngine> rules_;
  const std::chrono::system_clock::time_point created_at_;

  mutable std::mutex mutex_;
  Position position_;
  std::map<ConnectionId, Seat> seats_;
  std::vector<std::string> move_history_;
  std::optional<int> white_user_id_;
  std::optional<int> black_user_id_;
  bool finished_{false};
  bool record_issued_{false};
};

}  // namespace chessroom
