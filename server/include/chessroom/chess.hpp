/*
 * 설명: 체스 포지션(FEN), 수 표현, 합법수 생성과 반복/무승부 판정 보조 기능을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_rules_test.cpp
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chessroom {

enum class Color : std::uint8_t { kWhite, kBlack };

constexpr Color Opposite(Color color) { return color == Color::kWhite ? Color::kBlack : Color::kWhite; }

enum class PieceType : std::uint8_t { kNone, kPawn, kKnight, kBishop, kRook, kQueen, kKing };

struct Piece {
  PieceType type{PieceType::kNone};
  Color color{Color::kWhite};

  bool Empty() const { return type == PieceType::kNone; }
  bool operator==(const Piece&) const = default;
};

// a1 = 0, h1 = 7, a8 = 56, h8 = 63
using Square = int;
constexpr Square kNoSquare = -1;

constexpr int FileOf(Square square) { return square & 7; }
constexpr int RankOf(Square square) { return square >> 3; }
constexpr Square MakeSquare(int file, int rank) { return rank * 8 + file; }

std::string SquareName(Square square);
std::optional<Square> ParseSquare(std::string_view text);

struct Move {
  Square from{kNoSquare};
  Square to{kNoSquare};
  PieceType promotion{PieceType::kNone};

  std::string ToUci() const;
  bool operator==(const Move&) const = default;
};

class Position {
 public:
  static constexpr std::uint8_t kWhiteKingside = 1;
  static constexpr std::uint8_t kWhiteQueenside = 2;
  static constexpr std::uint8_t kBlackKingside = 4;
  static constexpr std::uint8_t kBlackQueenside = 8;

  static constexpr std::string_view kStartFen = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

  static Position Start();
  static std::optional<Position> FromFen(std::string_view fen);

  std::string ToFen() const;

  Piece At(Square square) const { return board_[square]; }
  Color SideToMove() const { return side_to_move_; }
  std::uint8_t CastlingRights() const { return castling_; }
  int HalfmoveClock() const { return halfmove_clock_; }
  int FullmoveNumber() const { return fullmove_number_; }

  bool InCheck() const;
  bool IsAttacked(Square square, Color by) const;

  std::vector<Move> LegalMoves() const;
  bool IsLegal(const Move& move) const;
  // 합법수라고 가정하고 적용한다. 호출자는 IsLegal로 먼저 검증해야 한다.
  void Play(const Move& move);

  // 현재 포지션을 포함해 동일 포지션이 등장한 횟수
  int RepetitionCount() const;
  bool HasInsufficientMaterial(Color color) const;
  bool IsInsufficientMaterial() const;

 private:
  std::vector<Move> PseudoLegalMoves() const;
  void AddPawnMoves(Square from, std::vector<Move>& out) const;
  void AddStepMoves(Square from, const int (*steps)[2], int count, std::vector<Move>& out) const;
  void AddSlidingMoves(Square from, const int (*dirs)[2], int count, std::vector<Move>& out) const;
  void AddCastlingMoves(Square from, std::vector<Move>& out) const;
  Square KingSquare(Color color) const;
  bool LeavesKingSafe(const Move& move) const;
  void MovePiece(const Move& move);
  Square LegalEnPassantSquare() const;
  std::string PlacementField() const;
  std::string CastlingField() const;
  std::string RepetitionKey() const;

  std::array<Piece, 64> board_{};
  Color side_to_move_{Color::kWhite};
  std::uint8_t castling_{0};
  Square en_passant_{kNoSquare};
  int halfmove_clock_{0};
  int fullmove_number_{1};
  // 마지막 비가역 수 이후 등장한 이전 포지션 키
  std::vector<std::string> history_;
};

}  // namespace chessroom
