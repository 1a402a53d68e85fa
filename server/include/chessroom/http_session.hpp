/*
 * 설명: HTTP 연결을 처리하고 상태/온라인 사용자/메트릭 엔드포인트와 룸 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "chessroom/config.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/room.hpp"
#include "chessroom/session_manager.hpp"

namespace chessroom {

struct WebSocketTarget {
  std::string room_id;
  JoinRequest request;
};

// "/ws/{room_id}?user_id=&username=&preferred=" 형식만 허용한다. 잘못된 user_id는 무시한다.
std::optional<WebSocketTarget> ParseWebSocketTarget(const std::string& target);
std::string PercentDecode(const std::string& text);

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<SessionManager> session_manager, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendJson(std::shared_ptr<Response> res, boost::beast::http::status status, const std::string& body);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace chessroom
