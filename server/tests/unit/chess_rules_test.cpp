#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "chessroom/chess_rules.hpp"

namespace {

using chessroom::ChessRules;
using chessroom::GameResult;
using chessroom::Position;
using chessroom::TerminalReason;

Position FromFenOrDie(const std::string& fen) {
  auto position = Position::FromFen(fen);
  EXPECT_TRUE(position.has_value()) << fen;
  return position.value_or(Position::Start());
}

void PlayAll(const ChessRules& rules, Position& position, const std::vector<std::string>& moves) {
  for (const auto& text : moves) {
    std::string error;
    auto move = rules.ParseMove(text, error);
    ASSERT_TRUE(move.has_value()) << text << ": " << error;
    ASSERT_TRUE(rules.IsLegal(position, *move)) << text;
    rules.Apply(position, *move);
  }
}

TEST(ChessRulesTest, StartingPositionHasTwentyMoves) {
  ChessRules rules;
  auto position = rules.InitialPosition();
  EXPECT_EQ(rules.Serialize(position), std::string(Position::kStartFen));
  EXPECT_EQ(rules.LegalMoves(position).size(), 20u);
  EXPECT_EQ(rules.SideToMove(position), chessroom::Color::kWhite);
  EXPECT_FALSE(rules.ClassifyTerminal(position).has_value());
}

TEST(ChessRulesTest, DoublePawnPushWithoutCaptureOmitsEnPassantField) {
  ChessRules rules;
  auto position = rules.InitialPosition();
  PlayAll(rules, position, {"e2e4"});
  EXPECT_EQ(rules.Serialize(position), "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1");
}

TEST(ChessRulesTest, FoolsMateIsCheckmateForBlack) {
  ChessRules rules;
  auto position = rules.InitialPosition();
  PlayAll(rules, position, {"f2f3", "e7e5", "g2g4"});
  EXPECT_FALSE(rules.ClassifyTerminal(position).has_value());
  PlayAll(rules, position, {"d8h4"});

  auto terminal = rules.ClassifyTerminal(position);
  ASSERT_TRUE(terminal.has_value());
  EXPECT_EQ(terminal->result, GameResult::kBlack);
  EXPECT_EQ(terminal->reason, TerminalReason::kCheckmate);
  EXPECT_TRUE(position.InCheck());
  EXPECT_TRUE(rules.LegalMoves(position).empty());
}

TEST(ChessRulesTest, StalemateIsDraw) {
  ChessRules rules;
  auto position = FromFenOrDie("7k/8/6K1/5Q2/8/8/8/8 w - - 0 1");
  PlayAll(rules, position, {"f5f7"});

  auto terminal = rules.ClassifyTerminal(position);
  ASSERT_TRUE(terminal.has_value());
  EXPECT_EQ(terminal->result, GameResult::kDraw);
  EXPECT_EQ(terminal->reason, TerminalReason::kStalemate);
}

TEST(ChessRulesTest, CapturingLastPieceLeavesInsufficientMaterial) {
  ChessRules rules;
  auto position = FromFenOrDie("8/8/4k3/8/3n4/3K4/8/8 w - - 0 1");
  EXPECT_FALSE(rules.ClassifyTerminal(position).has_value());
  PlayAll(rules, position, {"d3d4"});

  auto terminal = rules.ClassifyTerminal(position);
  ASSERT_TRUE(terminal.has_value());
  EXPECT_EQ(terminal->result, GameResult::kDraw);
  EXPECT_EQ(terminal->reason, TerminalReason::kInsufficientMaterial);
}

TEST(ChessRulesTest, KingAndBishopAgainstKingIsInsufficient) {
  auto position = FromFenOrDie("8/8/4k3/8/8/3KB3/8/8 w - - 0 1");
  EXPECT_TRUE(position.IsInsufficientMaterial());
  auto with_rook = FromFenOrDie("8/8/4k3/8/8/3KR3/8/8 w - - 0 1");
  EXPECT_FALSE(with_rook.IsInsufficientMaterial());
}

TEST(ChessRulesTest, FivefoldRepetitionEndsGameAsRepetitionDraw) {
  ChessRules rules;
  auto position = rules.InitialPosition();
  const std::vector<std::string> shuffle{"g1f3", "g8f6", "f3g1", "f6g8"};

  for (int cycle = 0; cycle < 3; ++cycle) {
    PlayAll(rules, position, shuffle);
    EXPECT_FALSE(rules.ClassifyTerminal(position).has_value()) << "cycle " << cycle;
  }
  EXPECT_EQ(position.RepetitionCount(), 4);

  PlayAll(rules, position, {"g1f3", "g8f6", "f3g1"});
  EXPECT_FALSE(rules.ClassifyTerminal(position).has_value());
  PlayAll(rules, position, {"f6g8"});

  EXPECT_EQ(position.RepetitionCount(), 5);
  auto terminal = rules.ClassifyTerminal(position);
  ASSERT_TRUE(terminal.has_value());
  EXPECT_EQ(terminal->result, GameResult::kDraw);
  EXPECT_EQ(terminal->reason, TerminalReason::kThreefoldRepetition);
}

TEST(ChessRulesTest, PawnMoveResetsRepetitionHistory) {
  ChessRules rules;
  auto position = rules.InitialPosition();
  PlayAll(rules, position, {"g1f3", "g8f6", "f3g1", "f6g8"});
  EXPECT_EQ(position.RepetitionCount(), 2);
  PlayAll(rules, position, {"e2e4"});
  EXPECT_EQ(position.RepetitionCount(), 1);
}

TEST(ChessRulesTest, SeventyFiveMoveRuleReportsFiftyMoveReason) {
  ChessRules rules;
  auto below = FromFenOrDie("4k3/8/8/8/8/8/4P3/R3K3 w - - 99 60");
  PlayAll(rules, below, {"a1a2"});
  EXPECT_EQ(below.HalfmoveClock(), 100);
  EXPECT_FALSE(rules.ClassifyTerminal(below).has_value());

  auto position = FromFenOrDie("4k3/8/8/8/8/8/4P3/R3K3 w - - 149 90");
  PlayAll(rules, position, {"a1a2"});
  EXPECT_EQ(position.HalfmoveClock(), 150);
  auto terminal = rules.ClassifyTerminal(position);
  ASSERT_TRUE(terminal.has_value());
  EXPECT_EQ(terminal->result, GameResult::kDraw);
  EXPECT_EQ(terminal->reason, TerminalReason::kFiftyMoveRule);
}

TEST(ChessRulesTest, CastlingMovesRookAndClearsRights) {
  ChessRules rules;
  auto position = FromFenOrDie("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
  PlayAll(rules, position, {"e1g1"});
  EXPECT_EQ(rules.Serialize(position), "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");
}

TEST(ChessRulesTest, CannotCastleThroughAttackedSquare) {
  ChessRules rules;
  auto position = FromFenOrDie("r3k2r/8/8/8/8/8/5r2/R3K2R w KQkq - 0 1");
  std::string error;
  EXPECT_FALSE(rules.IsLegal(position, *rules.ParseMove("e1g1", error)));
  EXPECT_TRUE(rules.IsLegal(position, *rules.ParseMove("e1c1", error)));
}

TEST(ChessRulesTest, EnPassantCaptureRemovesPassedPawn) {
  ChessRules rules;
  auto position = rules.InitialPosition();
  PlayAll(rules, position, {"e2e4", "a7a6", "e4e5", "d7d5"});
  EXPECT_EQ(rules.Serialize(position), "rnbqkbnr/1pp1pppp/p7/3pP3/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3");

  PlayAll(rules, position, {"e5d6"});
  EXPECT_TRUE(position.At(*chessroom::ParseSquare("d5")).Empty());
  EXPECT_EQ(position.At(*chessroom::ParseSquare("d6")),
            (chessroom::Piece{chessroom::PieceType::kPawn, chessroom::Color::kWhite}));
}

TEST(ChessRulesTest, PromotionRequiresPieceSuffix) {
  ChessRules rules;
  auto position = FromFenOrDie("8/P7/8/8/8/8/8/k6K w - - 0 1");
  std::string error;
  EXPECT_FALSE(rules.IsLegal(position, *rules.ParseMove("a7a8", error)));
  auto promotion = rules.ParseMove("a7a8q", error);
  ASSERT_TRUE(promotion.has_value());
  ASSERT_TRUE(rules.IsLegal(position, *promotion));
  rules.Apply(position, *promotion);
  EXPECT_EQ(position.At(*chessroom::ParseSquare("a8")),
            (chessroom::Piece{chessroom::PieceType::kQueen, chessroom::Color::kWhite}));
  EXPECT_EQ(promotion->ToUci(), "a7a8q");
}

TEST(ChessRulesTest, ParseMoveRejectsMalformedText) {
  ChessRules rules;
  std::string error;
  EXPECT_FALSE(rules.ParseMove("e2", error).has_value());
  EXPECT_EQ(error, "move must be 4 or 5 characters");
  EXPECT_FALSE(rules.ParseMove("z2e4", error).has_value());
  EXPECT_EQ(error, "invalid square");
  EXPECT_FALSE(rules.ParseMove("a7a8k", error).has_value());
  EXPECT_EQ(error, "invalid promotion piece");
}

TEST(ChessRulesTest, FromFenRejectsPositionWithoutKings) {
  EXPECT_FALSE(Position::FromFen("8/8/8/8/8/8/8/8 w - - 0 1").has_value());
  EXPECT_FALSE(Position::FromFen("not a fen").has_value());
}

}  // namespace
