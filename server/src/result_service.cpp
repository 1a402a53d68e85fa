/*
 * 설명: 게임 기록 INSERT와 양측 레이팅 갱신을 하나의 재시도 트랜잭션으로 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/finalize_it_test.cpp
 */
#include "chessroom/result_service.hpp"

namespace chessroom {

ResultService::ResultService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<GameRepository> repository,
                             std::shared_ptr<RatingService> rating_service)
    : db_client_(std::move(db_client)), repository_(std::move(repository)), rating_service_(std::move(rating_service)) {}

bool ResultService::RecordFinishedGame(const GameRecord& record) {
  bool rated = false;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    rated = false;
    bool inserted = repository_->InsertGame(conn, record);
    if (!inserted) {
      // 같은 game_id는 이미 반영되었다.
      return true;
    }
    if (!record.white_user_id || !record.black_user_id) {
      return true;
    }
    rated = rating_service_->ApplyGameResultInTx(conn, *record.white_user_id, *record.black_user_id, record.result);
    return true;
  });
  return rated;
}

}  // namespace chessroom
