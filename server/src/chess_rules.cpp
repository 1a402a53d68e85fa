/*
 * 설명: 체스 규칙 어댑터. 합법성 검사, 수 적용, 종료 판정과 좌표 표기 파싱을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_rules_test.cpp
 */
#include "chessroom/chess_rules.hpp"

namespace chessroom {

std::string_view ToString(GameResult result) {
  switch (result) {
    case GameResult::kWhite: return "white";
    case GameResult::kBlack: return "black";
    case GameResult::kDraw: return "draw";
  }
  return "draw";
}

std::string_view ToString(TerminalReason reason) {
  switch (reason) {
    case TerminalReason::kCheckmate: return "checkmate";
    case TerminalReason::kStalemate: return "stalemate";
    case TerminalReason::kInsufficientMaterial: return "insufficient_material";
    case TerminalReason::kThreefoldRepetition: return "threefold_repetition";
    case TerminalReason::kFiftyMoveRule: return "fifty_move_rule";
    case TerminalReason::kDraw: return "draw";
  }
  return "draw";
}

Position ChessRules::InitialPosition() const { return Position::Start(); }

std::vector<Move> ChessRules::LegalMoves(const Position& position) const { return position.LegalMoves(); }

bool ChessRules::IsLegal(const Position& position, const Move& move) const { return position.IsLegal(move); }

void ChessRules::Apply(Position& position, const Move& move) const { position.Play(move); }

std::optional<TerminalStatus> ChessRules::ClassifyTerminal(const Position& position) const {
  const bool no_moves = position.LegalMoves().empty();
  if (no_moves && position.InCheck()) {
    // 수를 둘 차례인 쪽이 패배한다.
    return TerminalStatus{position.SideToMove() == Color::kWhite ? GameResult::kBlack : GameResult::kWhite,
                          TerminalReason::kCheckmate};
  }
  if (no_moves) {
    return TerminalStatus{GameResult::kDraw, TerminalReason::kStalemate};
  }
  if (position.IsInsufficientMaterial()) {
    return TerminalStatus{GameResult::kDraw, TerminalReason::kInsufficientMaterial};
  }

  const int repetitions = position.RepetitionCount();
  const int halfmoves = position.HalfmoveClock();
  if (repetitions < kFivefoldRepetition && halfmoves < kSeventyFiveMoveHalfmoves) {
    return std::nullopt;
  }
  if (repetitions >= kThreefoldRepetition) {
    return TerminalStatus{GameResult::kDraw, TerminalReason::kThreefoldRepetition};
  }
  if (halfmoves >= kFiftyMoveHalfmoves) {
    return TerminalStatus{GameResult::kDraw, TerminalReason::kFiftyMoveRule};
  }
  return TerminalStatus{GameResult::kDraw, TerminalReason::kDraw};
}

std::string ChessRules::Serialize(const Position& position) const { return position.ToFen(); }

std::optional<Move> ChessRules::ParseMove(std::string_view text, std::string& error_message) const {
  if (text.size() != 4 && text.size() != 5) {
    error_message = "move must be 4 or 5 characters";
    return std::nullopt;
  }
  auto from = ParseSquare(text.substr(0, 2));
  auto to = ParseSquare(text.substr(2, 2));
  if (!from || !to) {
    error_message = "invalid square";
    return std::nullopt;
  }
  Move move{*from, *to};
  if (text.size() == 5) {
    switch (text[4]) {
      case 'q': move.promotion = PieceType::kQueen; break;
      case 'r': move.promotion = PieceType::kRook; break;
      case 'b': move.promotion = PieceType::kBishop; break;
      case 'n': move.promotion = PieceType::kKnight; break;
      default:
        error_message = "invalid promotion piece";
        return std::nullopt;
    }
  }
  return move;
}

Color ChessRules::SideToMove(const Position& position) const { return position.SideToMove(); }

}  // namespace chessroom
