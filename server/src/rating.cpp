/*
 * 설명: Elo 기대 승률/갱신 계산과 users 테이블의 레이팅·전적 반영을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/unit/rating_update_test.cpp, server/tests/it/finalize_it_test.cpp
 */
#include "chessroom/rating.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_map>

namespace chessroom {
namespace {
int ToInt(const std::optional<std::string>& value) { return value ? std::stoi(*value) : 0; }
}  // namespace

double ExpectedScore(int rating, int opponent_rating) {
  double exponent = static_cast<double>(opponent_rating - rating) / 400.0;
  return 1.0 / (1.0 + std::pow(10.0, exponent));
}

int NextRating(int rating, double expected, double score) {
  double delta = static_cast<double>(kEloKFactor) * (score - expected);
  // 정확히 .5인 경우 짝수 쪽으로 반올림한다(기본 반올림 모드).
  int next = static_cast<int>(std::nearbyint(static_cast<double>(rating) + delta));
  return std::max(kMinimumRating, next);
}

RatingChange ComputeRatingChange(const UserRating& white, const UserRating& black, GameResult result) {
  double white_score = 0.5;
  double black_score = 0.5;
  RatingChange change{white, black};
  switch (result) {
    case GameResult::kWhite:
      white_score = 1.0;
      black_score = 0.0;
      change.white.wins += 1;
      change.black.losses += 1;
      break;
    case GameResult::kBlack:
      white_score = 0.0;
      black_score = 1.0;
      change.white.losses += 1;
      change.black.wins += 1;
      break;
    case GameResult::kDraw:
      change.white.draws += 1;
      change.black.draws += 1;
      break;
  }
  change.white.rating = NextRating(white.rating, ExpectedScore(white.rating, black.rating), white_score);
  change.black.rating = NextRating(black.rating, ExpectedScore(black.rating, white.rating), black_score);
  return change;
}

RatingService::RatingService(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::optional<UserRating> RatingService::GetUser(int user_id) {
  std::optional<UserRating> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, rating, wins, losses, draws FROM users WHERE id=" << user_id << ";";
    auto rows = db_client_->Query(conn, oss.str(), "사용자 조회 실패");
    if (!rows.empty()) {
      result = BuildUser(rows.front());
    }
  });
  return result;
}

bool RatingService::ApplyGameResultInTx(MYSQL* conn, int white_id, int black_id, GameResult result) {
  std::ostringstream select;
  select << "SELECT id, rating, wins, losses, draws FROM users WHERE id IN (" << white_id << "," << black_id
         << ") FOR UPDATE;";
  auto rows = db_client_->Query(conn, select.str(), "레이팅 조회 실패");
  std::unordered_map<int, UserRating> current;
  for (const auto& row : rows) {
    auto user = BuildUser(row);
    current[user.user_id] = user;
  }
  auto white_it = current.find(white_id);
  auto black_it = current.find(black_id);
  if (white_it == current.end() || black_it == current.end()) {
    return false;
  }

  const UserRating& white = white_it->second;
  const UserRating& black = black_it->second;
  auto change = ComputeRatingChange(white, black, result);
  if (white_id == black_id) {
    change.white.rating = white.rating;
    change.black.rating = black.rating;
  }
  ApplyUserChangeInTx(conn, white, change.white);
  ApplyUserChangeInTx(conn, black, change.black);
  return true;
}

void RatingService::UpdateUserInTx(MYSQL* conn, const UserRating& user) {
  std::ostringstream update;
  update << "UPDATE users SET rating=" << user.rating << ", wins=" << user.wins << ", losses=" << user.losses
         << ", draws=" << user.draws << " WHERE id=" << user.user_id << ";";
  db_client_->Execute(conn, update.str(), "사용자 레이팅 갱신 실패");
}

void RatingService::ApplyUserChangeInTx(MYSQL* conn, const UserRating& before, const UserRating& after) {
  std::ostringstream update;
  update << "UPDATE users SET rating=" << after.rating << ", wins=wins+" << (after.wins - before.wins)
         << ", losses=losses+" << (after.losses - before.losses) << ", draws=draws+" << (after.draws - before.draws)
         << " WHERE id=" << after.user_id << ";";
  db_client_->Execute(conn, update.str(), "사용자 레이팅 갱신 실패");
}

void RatingService::EnsureUserInTx(MYSQL* conn, int user_id, const std::string& username) {
  std::ostringstream insert;
  insert << "INSERT INTO users(id, username) VALUES(" << user_id << ", '" << db_client_->Escape(conn, username)
         << "') ON DUPLICATE KEY UPDATE id=id;";
  db_client_->Execute(conn, insert.str(), "사용자 보장 실패");
}

UserRating RatingService::BuildUser(const DbRow& row) const {
  return UserRating{ToInt(row.at(0)), ToInt(row.at(1)), ToInt(row.at(2)), ToInt(row.at(3)), ToInt(row.at(4))};
}

}  // namespace chessroom
