/*
 * 설명: 체스 포지션 구현을 RulesEngine 인터페이스에 연결하고 종료 사유를 우선순위대로 분류한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_rules_test.cpp
 */
#pragma once

#include "chessroom/rules_engine.hpp"

namespace chessroom {

class ChessRules : public RulesEngine {
 public:
  static constexpr int kFivefoldRepetition = 5;
  static constexpr int kThreefoldRepetition = 3;
  static constexpr int kSeventyFiveMoveHalfmoves = 150;
  static constexpr int kFiftyMoveHalfmoves = 100;

  Position InitialPosition() const override;
  std::vector<Move> LegalMoves(const Position& position) const override;
  bool IsLegal(const Position& position, const Move& move) const override;
  void Apply(Position& position, const Move& move) const override;
  std::optional<TerminalStatus> ClassifyTerminal(const Position& position) const override;
  std::string Serialize(const Position& position) const override;
  std::optional<Move> ParseMove(std::string_view text, std::string& error_message) const override;
  Color SideToMove(const Position& position) const override;
};

}  // namespace chessroom
