/*
 * 설명: 룸별 연결을 등록/해제하고 잠금 밖에서 비차단 전송으로 브로드캐스트한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_hub_test.cpp
 */
#include "chessroom/connection_hub.hpp"

#include <utility>

namespace chessroom {

void ConnectionHub::Register(const std::string& room_id, ConnectionId connection, Seat seat,
                             const std::shared_ptr<ClientConnection>& client, const JoinRequest& identity) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = rooms_[room_id].insert_or_assign(
      connection, Entry{client, seat, identity.user_id, identity.username});
  if (inserted) {
    ++active_;
  }
  UpdateGauge();
}

void ConnectionHub::Unregister(const std::string& room_id, ConnectionId connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto room_it = rooms_.find(room_id);
  if (room_it == rooms_.end()) {
    return;
  }
  if (room_it->second.erase(connection) > 0) {
    --active_;
  }
  if (room_it->second.empty()) {
    rooms_.erase(room_it);
  }
  UpdateGauge();
}

std::size_t ConnectionHub::Broadcast(const std::string& room_id, const PayloadBuilder& builder) {
  std::vector<std::pair<ConnectionId, Entry>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
      return 0;
    }
    targets.assign(room_it->second.begin(), room_it->second.end());
  }

  std::size_t delivered = 0;
  std::vector<ConnectionId> failed;
  for (const auto& [connection, entry] : targets) {
    auto client = entry.client.lock();
    if (client && client->Send(builder(entry.seat))) {
      ++delivered;
    } else {
      failed.push_back(connection);
    }
  }
  for (ConnectionId connection : failed) {
    Unregister(room_id, connection);
    if (observability_) {
      observability_->Log(LogContext{LogLevel::kWarn, "ws.send_failed", "", room_id, connection, std::nullopt,
                                     "브로드캐스트 실패로 연결을 해제했습니다"});
    }
  }
  return delivered;
}

bool ConnectionHub::SendTo(const std::string& room_id, ConnectionId connection, std::string message) {
  std::shared_ptr<ClientConnection> client;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto room_it = rooms_.find(room_id);
    if (room_it == rooms_.end()) {
      return false;
    }
    auto it = room_it->second.find(connection);
    if (it == room_it->second.end()) {
      return false;
    }
    client = it->second.client.lock();
  }
  if (client && client->Send(std::move(message))) {
    return true;
  }
  Unregister(room_id, connection);
  return false;
}

std::vector<OnlineUser> ConnectionHub::OnlineUsers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<int, std::string> by_user_id;
  for (const auto& [room_id, connections] : rooms_) {
    for (const auto& [connection, entry] : connections) {
      if (entry.user_id && entry.username) {
        by_user_id[*entry.user_id] = *entry.username;
      }
    }
  }
  std::vector<OnlineUser> users;
  users.reserve(by_user_id.size());
  for (const auto& [user_id, username] : by_user_id) {
    users.push_back(OnlineUser{user_id, username});
  }
  return users;
}

std::size_t ConnectionHub::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

std::size_t ConnectionHub::RoomConnections(const std::string& room_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto room_it = rooms_.find(room_id);
  return room_it == rooms_.end() ? 0 : room_it->second.size();
}

void ConnectionHub::UpdateGauge() {
  if (observability_) {
    observability_->SetWebsocketActive(active_);
  }
}

}  // namespace chessroom
