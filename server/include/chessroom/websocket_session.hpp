/*
 * 설명: 룸에 입장한 WebSocket 연결의 수 메시지 처리, 송신 큐 백프레셔와 종료 처리를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "chessroom/connection_hub.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/room.hpp"
#include "chessroom/session_manager.hpp"

namespace chessroom {

class WebSocketSession : public ClientConnection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string room_id,
                   JoinRequest identity, std::shared_ptr<SessionManager> session_manager,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;

  void Run();

  // 다른 스트랜드에서도 호출된다. 실제 큐 적재는 이 연결의 실행기에서 수행한다.
  bool Send(std::string message) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleText(const std::string& data);
  void SendError(std::string_view message);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void Disconnect();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::string room_id_;
  JoinRequest identity_;
  ConnectionId connection_id_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  std::atomic<bool> closing_{false};
  std::atomic<bool> disconnected_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace chessroom
