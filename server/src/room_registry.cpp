/*
 * 설명: 룸 레지스트리. 없으면 생성하는 삽입을 단일 뮤텍스로 보호하고 게임 ID를 발급한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#include "chessroom/room_registry.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace chessroom {
namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

RoomRegistry::RoomRegistry(std::shared_ptr<const RulesEngine> rules) : rules_(std::move(rules)) {}

std::shared_ptr<Room> RoomRegistry::GetOrCreate(const std::string& room_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  if (it != rooms_.end()) {
    return it->second;
  }
  auto room = std::make_shared<Room>(room_id, GenerateGameId(), rules_);
  rooms_.emplace(room_id, room);
  return room;
}

std::shared_ptr<Room> RoomRegistry::Find(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room_id);
  return it == rooms_.end() ? nullptr : it->second;
}

std::size_t RoomRegistry::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rooms_.size();
}

std::string RoomRegistry::GenerateGameId() {
  std::vector<unsigned char> buffer(16);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("게임 ID 난수 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

}  // namespace chessroom
