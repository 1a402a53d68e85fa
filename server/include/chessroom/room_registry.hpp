/*
 * 설명: 룸 ID별 Room 인스턴스를 원자적으로 생성/조회하는 유일한 공유 맵이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "chessroom/room.hpp"
#include "chessroom/rules_engine.hpp"

namespace chessroom {

class RoomRegistry {
 public:
  explicit RoomRegistry(std::shared_ptr<const RulesEngine> rules);

  // 같은 ID로 동시에 호출해도 동일한 Room을 돌려준다. 삭제 연산은 없다.
  std::shared_ptr<Room> GetOrCreate(const std::string& room_id);
  std::shared_ptr<Room> Find(const std::string& room_id) const;
  std::size_t Count() const;

 private:
  std::string GenerateGameId();

  std::shared_ptr<const RulesEngine> rules_;
  std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;
  mutable std::mutex mutex_;
};

}  // namespace chessroom
