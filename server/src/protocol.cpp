/*
 * 설명: 게임 메시지와 JSON 응답 엔벨로프를 생성하고 클라이언트 메시지를 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#include "chessroom/protocol.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace chessroom {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

std::optional<ClientMessage> ParseClientMessage(std::string_view raw, std::string& error_message) {
  auto message = nlohmann::json::parse(raw, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    error_message = "Malformed message";
    return std::nullopt;
  }
  auto type_it = message.find("type");
  if (type_it == message.end() || !type_it->is_string()) {
    error_message = "Message type is required";
    return std::nullopt;
  }
  if (*type_it != "move") {
    error_message = "Unknown message type";
    return std::nullopt;
  }
  auto move_it = message.find("move");
  if (move_it == message.end() || !move_it->is_string()) {
    error_message = "Move must be a string";
    return std::nullopt;
  }
  return ClientMessage{ClientMessageType::kMove, move_it->get<std::string>()};
}

nlohmann::json BuildStateMessage(const std::string& fen, Seat seat) {
  return {{"type", "state"}, {"fen", fen}, {"color", ToString(seat)}};
}

nlohmann::json BuildStateMessage(const AppliedMove& applied, Seat seat) {
  auto message = BuildStateMessage(applied.fen, seat);
  message["last_move"] = applied.last_move;
  if (applied.terminal) {
    message["game_over"] = true;
    message["result"] = ToString(applied.terminal->result);
    message["reason"] = ToString(applied.terminal->reason);
  }
  return message;
}

nlohmann::json BuildErrorMessage(std::string_view message) { return {{"type", "error"}, {"message", message}}; }

nlohmann::json BuildOnlineUsersMessage(const std::vector<OnlineUser>& users) {
  nlohmann::json message = nlohmann::json::array();
  for (const auto& user : users) {
    message.push_back({{"user_id", user.user_id}, {"username", user.username}});
  }
  return message;
}

std::string ToWireText(const nlohmann::json& message) {
  return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace chessroom
