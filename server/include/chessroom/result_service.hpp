/*
 * 설명: 종료된 게임의 기록 저장과 레이팅 반영을 단일 트랜잭션으로 묶는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/finalize_it_test.cpp, server/tests/unit/session_manager_test.cpp
 */
#pragma once

#include <memory>

#include "chessroom/db_client.hpp"
#include "chessroom/game_record.hpp"
#include "chessroom/game_repository.hpp"
#include "chessroom/rating.hpp"

namespace chessroom {

// 세션 매니저가 게임 종료 시 호출하는 저장 경계. 실패는 DbException 등 예외로 알린다.
class GameResultSink {
 public:
  virtual ~GameResultSink() = default;
  // 레이팅까지 반영되면 true, 기록만 저장되었거나 중복이면 false
  virtual bool RecordFinishedGame(const GameRecord& record) = 0;
};

class ResultService : public GameResultSink {
 public:
  ResultService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<GameRepository> repository,
                std::shared_ptr<RatingService> rating_service);

  bool RecordFinishedGame(const GameRecord& record) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<GameRepository> repository_;
  std::shared_ptr<RatingService> rating_service_;
};

}  // namespace chessroom
