/*
 * 설명: Elo 레이팅 계산(K=32, 하한 100)과 MariaDB 사용자 레이팅/전적 조회·갱신을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/unit/rating_update_test.cpp, server/tests/it/finalize_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "chessroom/db_client.hpp"
#include "chessroom/rules_engine.hpp"

namespace chessroom {

struct UserRating {
  int user_id;
  int rating;
  int wins;
  int losses;
  int draws;
};

struct RatingChange {
  UserRating white;
  UserRating black;
};

constexpr int kEloKFactor = 32;
constexpr int kMinimumRating = 100;

double ExpectedScore(int rating, int opponent_rating);
int NextRating(int rating, double expected, double score);
RatingChange ComputeRatingChange(const UserRating& white, const UserRating& black, GameResult result);

class RatingService {
 public:
  explicit RatingService(std::shared_ptr<MariaDbClient> db_client);

  std::optional<UserRating> GetUser(int user_id);
  // 두 사용자 행이 모두 있을 때만 갱신하고 true를 돌려준다.
  // 같은 계정이 양쪽 좌석에 앉았으면 레이팅은 그대로 두고 전적만 양쪽 몫을 모두 더한다.
  bool ApplyGameResultInTx(MYSQL* conn, int white_id, int black_id, GameResult result);
  // 레이팅과 전적을 주어진 값으로 덮어쓴다.
  void UpdateUserInTx(MYSQL* conn, const UserRating& user);
  // 계정 생성은 외부 서비스 몫이다. 시드/테스트용으로 기본 레이팅 행을 보장한다.
  void EnsureUserInTx(MYSQL* conn, int user_id, const std::string& username);

 private:
  UserRating BuildUser(const DbRow& row) const;
  // 전적은 before 대비 증분으로 더해 같은 행에 대한 두 번의 갱신이 서로 덮어쓰지 않게 한다.
  void ApplyUserChangeInTx(MYSQL* conn, const UserRating& before, const UserRating& after);

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace chessroom
