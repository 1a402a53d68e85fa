/*
 * 설명: WS 게임 메시지(state/error/move)와 HTTP 응답 엔벨로프의 생성/해석을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "chessroom/connection_hub.hpp"
#include "chessroom/room.hpp"

namespace chessroom {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

enum class ClientMessageType { kMove };

struct ClientMessage {
  ClientMessageType type;
  std::string move;
};

// 형식 오류는 nullopt와 error_message로 알린다. 연결은 유지된다.
std::optional<ClientMessage> ParseClientMessage(std::string_view raw, std::string& error_message);

nlohmann::json BuildStateMessage(const std::string& fen, Seat seat);
nlohmann::json BuildStateMessage(const AppliedMove& applied, Seat seat);
nlohmann::json BuildErrorMessage(std::string_view message);
nlohmann::json BuildOnlineUsersMessage(const std::vector<OnlineUser>& users);

// 룸 ID와 사용자 이름은 퍼센트 디코딩된 임의 바이트일 수 있다. 잘못된 UTF-8은 U+FFFD로 바꿔 직렬화한다.
std::string ToWireText(const nlohmann::json& message);

}  // namespace chessroom
