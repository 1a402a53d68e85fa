/*
 * 설명: 종료된 게임 레코드를 MariaDB games 테이블에 저장하고 중복을 DB 제약으로 차단한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/finalize_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "chessroom/db_client.hpp"
#include "chessroom/game_record.hpp"

namespace chessroom {

class GameRepository {
 public:
  explicit GameRepository(std::shared_ptr<MariaDbClient> db_client);

  // game_id가 이미 저장되어 있으면 false를 돌려준다.
  bool InsertGame(MYSQL* conn, const GameRecord& record);

  std::size_t Count() const;
  std::size_t CountForRoom(const std::string& room_id) const;
  std::optional<GameRecord> FindByGameId(const std::string& game_id) const;
  void ClearAll() const;

 private:
  GameRecord BuildRecord(const DbRow& row) const;
  std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace chessroom
