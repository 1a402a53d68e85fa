/*
 * 설명: 룸이 의존하는 보드 규칙 엔진 인터페이스와 종료 판정 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_rules_test.cpp, server/tests/unit/room_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chessroom/chess.hpp"

namespace chessroom {

enum class GameResult { kWhite, kBlack, kDraw };

enum class TerminalReason {
  kCheckmate,
  kStalemate,
  kInsufficientMaterial,
  kThreefoldRepetition,
  kFiftyMoveRule,
  kDraw,
};

struct TerminalStatus {
  GameResult result;
  TerminalReason reason;
};

std::string_view ToString(GameResult result);
std::string_view ToString(TerminalReason reason);

class RulesEngine {
 public:
  virtual ~RulesEngine() = default;

  virtual Position InitialPosition() const = 0;
  virtual std::vector<Move> LegalMoves(const Position& position) const = 0;
  virtual bool IsLegal(const Position& position, const Move& move) const = 0;
  // 주어진 position 인스턴스만 변경한다.
  virtual void Apply(Position& position, const Move& move) const = 0;
  virtual std::optional<TerminalStatus> ClassifyTerminal(const Position& position) const = 0;
  virtual std::string Serialize(const Position& position) const = 0;
  virtual std::optional<Move> ParseMove(std::string_view text, std::string& error_message) const = 0;
  virtual Color SideToMove(const Position& position) const = 0;
};

}  // namespace chessroom
