/*
 * 설명: WebSocket 텍스트 프레임을 수 제출로 변환하고 송신 큐를 직렬화하며 연결 종료 시 좌석을 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "chessroom/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "chessroom/protocol.hpp"

namespace chessroom {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string room_id,
                                   JoinRequest identity, std::shared_ptr<SessionManager> session_manager,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), room_id_(std::move(room_id)), identity_(std::move(identity)),
      connection_id_(session_manager->NextConnectionId()), session_manager_(std::move(session_manager)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { Disconnect(); }

void WebSocketSession::Run() {
  session_manager_->Connect(room_id_, connection_id_, identity_, shared_from_this());
  DoRead();
}

bool WebSocketSession::Send(std::string message) {
  if (closing_) {
    return false;
  }
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(),
                    [self, message = std::move(message)]() mutable { self->EnqueueMessage(std::move(message)); });
  return true;
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    if (ec != boost::beast::websocket::error::closed && observability_ && observability_->Enabled(LogLevel::kDebug)) {
      observability_->Log(LogContext{LogLevel::kDebug, "ws.read_failed", observability_->NextTraceId(), room_id_,
                                     connection_id_, identity_.user_id, ec.message()});
    }
    closing_ = true;
    Disconnect();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  HandleText(data);
  DoRead();
}

void WebSocketSession::HandleText(const std::string& data) {
  std::string error_message;
  auto message = ParseClientMessage(data, error_message);
  if (!message) {
    SendError(error_message);
    return;
  }
  auto result = session_manager_->SubmitMove(room_id_, connection_id_, message->move);
  if (!result.Accepted()) {
    SendError(result.error_message);
  }
}

void WebSocketSession::SendError(std::string_view message) {
  EnqueueMessage(ToWireText(BuildErrorMessage(message)));
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec || closing_) {
    closing_ = true;
    send_queue_.clear();
    queued_bytes_ = 0;
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_.exchange(true)) {
    return;
  }
  // 진행 중인 async_write가 front 버퍼를 참조하므로 큐는 OnWrite에서 비운다.
  if (observability_) {
    observability_->Log(LogContext{LogLevel::kWarn, "ws.backpressure_close", observability_->NextTraceId(), room_id_,
                                   connection_id_, identity_.user_id, "send queue limit exceeded"});
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::Disconnect() {
  if (disconnected_.exchange(true)) {
    return;
  }
  session_manager_->Disconnect(room_id_, connection_id_);
}

}  // namespace chessroom
