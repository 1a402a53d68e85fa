/*
 * 설명: 좌석 배정 정책, 차례/합법성 검사, 수 기록과 1회성 종료 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_test.cpp, server/tests/unit/session_manager_test.cpp
 */
#include "chessroom/room.hpp"

#include <utility>

namespace chessroom {

std::string_view ToString(Seat seat) {
  switch (seat) {
    case Seat::kWhite: return "w";
    case Seat::kBlack: return "b";
    case Seat::kSpectator: return "spectator";
  }
  return "spectator";
}

SeatPreference ParseSeatPreference(std::string_view text) {
  if (text == "w") {
    return SeatPreference::kWhite;
  }
  if (text == "b") {
    return SeatPreference::kBlack;
  }
  return SeatPreference::kAny;
}

Room::Room(std::string id, std::string game_id, std::shared_ptr<const RulesEngine> rules,
           std::chrono::system_clock::time_point created_at)
    : id_(std::move(id)), game_id_(std::move(game_id)), rules_(std::move(rules)), created_at_(created_at),
      position_(rules_->InitialPosition()) {}

Seat Room::Join(ConnectionId connection, const JoinRequest& request, const SeatedHandler& on_seated) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto existing = seats_.find(connection);
  Seat seat = existing != seats_.end() ? existing->second : PickSeat(request.preference);
  seats_[connection] = seat;

  if (request.user_id) {
    if (seat == Seat::kWhite && !white_user_id_) {
      white_user_id_ = request.user_id;
    } else if (seat == Seat::kBlack && !black_user_id_) {
      black_user_id_ = request.user_id;
    }
  }

  if (on_seated) {
    on_seated(seat, rules_->Serialize(position_));
  }
  return seat;
}

bool Room::Leave(ConnectionId connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  return seats_.erase(connection) > 0;
}

MoveResult Room::SubmitMove(ConnectionId connection, std::string_view move_text, const CommitHandler& on_commit) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finished_) {
    return Reject(MoveStatus::kGameFinished, "Game is already over");
  }
  auto seat_it = seats_.find(connection);
  if (seat_it == seats_.end()) {
    return Reject(MoveStatus::kNotSeated, "Not seated in this room");
  }
  const Seat seat = seat_it->second;
  if (seat == Seat::kSpectator) {
    return Reject(MoveStatus::kSpectator, "Spectators cannot make moves");
  }
  const Seat to_move = rules_->SideToMove(position_) == Color::kWhite ? Seat::kWhite : Seat::kBlack;
  if (seat != to_move) {
    return Reject(MoveStatus::kNotYourTurn, "It is not your turn");
  }

  std::string parse_error;
  auto move = rules_->ParseMove(move_text, parse_error);
  if (!move || !rules_->IsLegal(position_, *move)) {
    return Reject(MoveStatus::kInvalidMove, "Invalid move");
  }

  rules_->Apply(position_, *move);
  AppliedMove applied{rules_->Serialize(position_), move->ToUci(), rules_->ClassifyTerminal(position_)};
  move_history_.push_back(applied.last_move);

  MoveResult result;
  if (applied.terminal && !record_issued_) {
    record_issued_ = true;
    result.finished_game = BuildRecord(*applied.terminal);
  }
  if (applied.terminal) {
    finished_ = true;
  }

  if (on_commit) {
    on_commit(applied);
  }
  return result;
}

std::string Room::Fen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rules_->Serialize(position_);
}

std::vector<std::string> Room::MoveHistory() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return move_history_;
}

std::optional<Seat> Room::SeatOf(ConnectionId connection) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = seats_.find(connection);
  if (it == seats_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<int> Room::WhiteUserId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return white_user_id_;
}

std::optional<int> Room::BlackUserId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return black_user_id_;
}

std::size_t Room::ConnectionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return seats_.size();
}

bool Room::Finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_;
}

RoomPhase Room::Phase() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finished_) {
    return RoomPhase::kFinished;
  }
  if (!move_history_.empty() || (IsOccupied(Seat::kWhite) && IsOccupied(Seat::kBlack))) {
    return RoomPhase::kActive;
  }
  return RoomPhase::kWaiting;
}

Seat Room::PickSeat(SeatPreference preference) const {
  const bool white_free = !IsOccupied(Seat::kWhite);
  const bool black_free = !IsOccupied(Seat::kBlack);
  if (preference == SeatPreference::kWhite && white_free) {
    return Seat::kWhite;
  }
  if (preference == SeatPreference::kBlack && black_free) {
    return Seat::kBlack;
  }
  if (white_free) {
    return Seat::kWhite;
  }
  if (black_free) {
    return Seat::kBlack;
  }
  return Seat::kSpectator;
}

bool Room::IsOccupied(Seat seat) const {
  for (const auto& [connection, held] : seats_) {
    if (held == seat) {
      return true;
    }
  }
  return false;
}

GameRecord Room::BuildRecord(const TerminalStatus& status) const {
  std::string moves;
  for (const auto& uci : move_history_) {
    if (!moves.empty()) {
      moves.push_back(' ');
    }
    moves += uci;
  }
  return GameRecord{game_id_,      id_,      white_user_id_, black_user_id_, status.result,
                    status.reason, moves,    created_at_,    std::chrono::system_clock::now()};
}

MoveResult Room::Reject(MoveStatus status, std::string message) {
  MoveResult result;
  result.status = status;
  result.error_message = std::move(message);
  return result;
}

}  // namespace chessroom
