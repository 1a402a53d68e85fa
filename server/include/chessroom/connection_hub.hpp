/*
 * 설명: 룸별 실시간 연결 집합을 관리하고 좌석별로 개별화된 메시지를 브로드캐스트한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_hub_test.cpp, server/tests/unit/session_manager_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chessroom/observability.hpp"
#include "chessroom/room.hpp"

namespace chessroom {

// WebSocketSession이 구현한다. Send는 큐에 넣기만 하고 즉시 반환해야 한다.
class ClientConnection {
 public:
  virtual ~ClientConnection() = default;
  // 피어가 이미 닫혔으면 false
  virtual bool Send(std::string message) = 0;
};

struct OnlineUser {
  int user_id;
  std::string username;
};

class ConnectionHub {
 public:
  using PayloadBuilder = std::function<std::string(Seat seat)>;

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  void Register(const std::string& room_id, ConnectionId connection, Seat seat,
                const std::shared_ptr<ClientConnection>& client, const JoinRequest& identity);
  void Unregister(const std::string& room_id, ConnectionId connection);

  // 등록된 모든 연결에 builder(seat) 결과를 보낸다. 실패한 연결은 등록 해제하고 나머지는 계속 전송한다.
  std::size_t Broadcast(const std::string& room_id, const PayloadBuilder& builder);
  bool SendTo(const std::string& room_id, ConnectionId connection, std::string message);

  std::vector<OnlineUser> OnlineUsers() const;
  std::size_t ActiveConnections() const;
  std::size_t RoomConnections(const std::string& room_id) const;

 private:
  struct Entry {
    std::weak_ptr<ClientConnection> client;
    Seat seat;
    std::optional<int> user_id;
    std::optional<std::string> username;
  };

  void UpdateGauge();

  std::unordered_map<std::string, std::map<ConnectionId, Entry>> rooms_;
  std::size_t active_{0};
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace chessroom
