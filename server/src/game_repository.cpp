/*
 * 설명: games 테이블 INSERT/조회와 타임스탬프 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/finalize_it_test.cpp
 */
#include "chessroom/game_repository.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace chessroom {
namespace {
std::optional<int> ToOptionalInt(const std::optional<std::string>& value) {
  if (!value) {
    return std::nullopt;
  }
  return std::stoi(*value);
}

std::chrono::system_clock::time_point ParseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

GameResult ParseGameResult(const std::string& text) {
  if (text == "white") {
    return GameResult::kWhite;
  }
  if (text == "black") {
    return GameResult::kBlack;
  }
  return GameResult::kDraw;
}

TerminalReason ParseTerminalReason(const std::string& text) {
  for (auto reason : {TerminalReason::kCheckmate, TerminalReason::kStalemate, TerminalReason::kInsufficientMaterial,
                      TerminalReason::kThreefoldRepetition, TerminalReason::kFiftyMoveRule}) {
    if (ToString(reason) == text) {
      return reason;
    }
  }
  return TerminalReason::kDraw;
}

std::string SqlNullable(const std::optional<int>& value) { return value ? std::to_string(*value) : "NULL"; }
}  // namespace

GameRepository::GameRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

bool GameRepository::InsertGame(MYSQL* conn, const GameRecord& record) {
  std::ostringstream oss;
  oss << "INSERT INTO games(game_id, room_id, white_id, black_id, result, reason, moves, created_at, finished_at) "
         "VALUES('"
      << db_client_->Escape(conn, record.game_id) << "', '" << db_client_->Escape(conn, record.room_id) << "', "
      << SqlNullable(record.white_user_id) << ", " << SqlNullable(record.black_user_id) << ", '"
      << ToString(record.result) << "', '" << ToString(record.reason) << "', '"
      << db_client_->Escape(conn, record.moves) << "', '" << ToTimestamp(record.created_at) << "', '"
      << ToTimestamp(record.finished_at) << "');";
  if (mysql_query(conn, oss.str().c_str()) != 0) {
    if (mysql_errno(conn) == MariaDbClient::kDuplicateEntry) {
      return false;
    }
    db_client_->RaiseError(conn, "게임 저장 실패");
  }
  return true;
}

std::size_t GameRepository::Count() const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto rows = db_client_->Query(conn, "SELECT COUNT(*) FROM games;", "게임 카운트 실패");
    if (!rows.empty() && rows.front().at(0)) {
      count = static_cast<std::size_t>(std::stoull(*rows.front().at(0)));
    }
  });
  return count;
}

std::size_t GameRepository::CountForRoom(const std::string& room_id) const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::string sql = "SELECT COUNT(*) FROM games WHERE room_id='" + db_client_->Escape(conn, room_id) + "';";
    auto rows = db_client_->Query(conn, sql, "룸별 게임 카운트 실패");
    if (!rows.empty() && rows.front().at(0)) {
      count = static_cast<std::size_t>(std::stoull(*rows.front().at(0)));
    }
  });
  return count;
}

std::optional<GameRecord> GameRepository::FindByGameId(const std::string& game_id) const {
  std::optional<GameRecord> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT game_id, room_id, white_id, black_id, result, reason, moves, created_at, finished_at FROM games "
           "WHERE game_id='"
        << db_client_->Escape(conn, game_id) << "';";
    auto rows = db_client_->Query(conn, oss.str(), "게임 조회 실패");
    if (!rows.empty()) {
      result = BuildRecord(rows.front());
    }
  });
  return result;
}

void GameRepository::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) { db_client_->Execute(conn, "DELETE FROM games;", "게임 삭제 실패"); });
}

GameRecord GameRepository::BuildRecord(const DbRow& row) const {
  auto text = [&row](std::size_t index) { return row.at(index).value_or(""); };
  return GameRecord{text(0),
                    text(1),
                    ToOptionalInt(row.at(2)),
                    ToOptionalInt(row.at(3)),
                    ParseGameResult(text(4)),
                    ParseTerminalReason(text(5)),
                    text(6),
                    ParseTimestamp(row.at(7).value_or("1970-01-01 00:00:00")),
                    ParseTimestamp(row.at(8).value_or("1970-01-01 00:00:00"))};
}

std::string GameRepository::ToTimestamp(const std::chrono::system_clock::time_point& tp) const {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

}  // namespace chessroom
