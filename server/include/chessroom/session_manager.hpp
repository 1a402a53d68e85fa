/*
 * 설명: WS 연결의 입장/수 제출/퇴장을 룸과 연결 허브에 연결하고 게임 종료 시 결과 저장을 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_manager_test.cpp, server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

#include "chessroom/connection_hub.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/result_service.hpp"
#include "chessroom/room.hpp"
#include "chessroom/room_registry.hpp"

namespace chessroom {

class SessionManager {
 public:
  SessionManager(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<ConnectionHub> hub,
                 std::shared_ptr<GameResultSink> result_sink, std::shared_ptr<Observability> observability);

  ConnectionId NextConnectionId() { return next_connection_id_.fetch_add(1) + 1; }

  // 좌석을 배정하고 허브에 등록한 뒤 현재 상태를 해당 연결에만 보낸다.
  Seat Connect(const std::string& room_id, ConnectionId connection, const JoinRequest& request,
               const std::shared_ptr<ClientConnection>& client);
  // 거부된 수는 status/error_message로 돌려주며 호출자가 제출자에게만 오류를 보낸다.
  MoveResult SubmitMove(const std::string& room_id, ConnectionId connection, std::string_view move_text);
  void Disconnect(const std::string& room_id, ConnectionId connection);

  std::shared_ptr<RoomRegistry> Registry() const { return registry_; }
  std::shared_ptr<ConnectionHub> Hub() const { return hub_; }

 private:
  void FinalizeGame(const GameRecord& record);

  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<ConnectionHub> hub_;
  std::shared_ptr<GameResultSink> result_sink_;
  std::shared_ptr<Observability> observability_;
  std::atomic<ConnectionId> next_connection_id_{0};
};

}  // namespace chessroom
