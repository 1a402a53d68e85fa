/*
 * 설명: FEN 파싱/직렬화, 합법수 생성, 수 적용과 반복/기물 부족 판정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/chess_rules_test.cpp
 */
#include "chessroom/chess.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>

namespace chessroom {
namespace {
constexpr int kKnightSteps[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
constexpr int kKingSteps[8][2] = {{1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
constexpr int kBishopDirs[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
constexpr int kRookDirs[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
constexpr PieceType kPromotionTypes[4] = {PieceType::kQueen, PieceType::kRook, PieceType::kBishop,
                                          PieceType::kKnight};

bool OnBoard(int file, int rank) { return file >= 0 && file < 8 && rank >= 0 && rank < 8; }

int Forward(Color color) { return color == Color::kWhite ? 1 : -1; }

int BackRank(Color color) { return color == Color::kWhite ? 0 : 7; }

bool IsDarkSquare(Square square) { return (FileOf(square) + RankOf(square)) % 2 == 0; }

char PieceChar(Piece piece) {
  char c = '?';
  switch (piece.type) {
    case PieceType::kPawn: c = 'p'; break;
    case PieceType::kKnight: c = 'n'; break;
    case PieceType::kBishop: c = 'b'; break;
    case PieceType::kRook: c = 'r'; break;
    case PieceType::kQueen: c = 'q'; break;
    case PieceType::kKing: c = 'k'; break;
    case PieceType::kNone: return '.';
  }
  return piece.color == Color::kWhite ? static_cast<char>(c - 'a' + 'A') : c;
}

std::optional<PieceType> PieceTypeFromChar(char c) {
  switch (c) {
    case 'p': return PieceType::kPawn;
    case 'n': return PieceType::kKnight;
    case 'b': return PieceType::kBishop;
    case 'r': return PieceType::kRook;
    case 'q': return PieceType::kQueen;
    case 'k': return PieceType::kKing;
    default: return std::nullopt;
  }
}

std::vector<std::string_view> SplitFields(std::string_view text) {
  std::vector<std::string_view> fields;
  std::size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && text[pos] == ' ') {
      ++pos;
    }
    if (pos >= text.size()) {
      break;
    }
    auto end = text.find(' ', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    fields.push_back(text.substr(pos, end - pos));
    pos = end;
  }
  return fields;
}

std::optional<int> ParseCounter(std::string_view text) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
    return std::nullopt;
  }
  return value;
}
}  // namespace

std::string SquareName(Square square) {
  return std::string{static_cast<char>('a' + FileOf(square)), static_cast<char>('1' + RankOf(square))};
}

std::optional<Square> ParseSquare(std::string_view text) {
  if (text.size() != 2) {
    return std::nullopt;
  }
  int file = text[0] - 'a';
  int rank = text[1] - '1';
  if (!OnBoard(file, rank)) {
    return std::nullopt;
  }
  return MakeSquare(file, rank);
}

std::string Move::ToUci() const {
  std::string uci = SquareName(from) + SquareName(to);
  if (promotion != PieceType::kNone) {
    uci.push_back(PieceChar(Piece{promotion, Color::kBlack}));
  }
  return uci;
}

Position Position::Start() { return *FromFen(kStartFen); }

std::optional<Position> Position::FromFen(std::string_view fen) {
  auto fields = SplitFields(fen);
  if (fields.size() < 4 || fields.size() > 6) {
    return std::nullopt;
  }

  Position pos;
  int rank = 7;
  int file = 0;
  for (char c : fields[0]) {
    if (c == '/') {
      if (file != 8 || rank == 0) {
        return std::nullopt;
      }
      --rank;
      file = 0;
      continue;
    }
    if (c >= '1' && c <= '8') {
      file += c - '0';
      if (file > 8) {
        return std::nullopt;
      }
      continue;
    }
    bool white = c >= 'A' && c <= 'Z';
    auto type = PieceTypeFromChar(white ? static_cast<char>(c - 'A' + 'a') : c);
    if (!type || file >= 8) {
      return std::nullopt;
    }
    pos.board_[MakeSquare(file, rank)] = Piece{*type, white ? Color::kWhite : Color::kBlack};
    ++file;
  }
  if (rank != 0 || file != 8) {
    return std::nullopt;
  }

  if (fields[1] == "w") {
    pos.side_to_move_ = Color::kWhite;
  } else if (fields[1] == "b") {
    pos.side_to_move_ = Color::kBlack;
  } else {
    return std::nullopt;
  }

  if (fields[2] != "-") {
    for (char c : fields[2]) {
      switch (c) {
        case 'K': pos.castling_ |= kWhiteKingside; break;
        case 'Q': pos.castling_ |= kWhiteQueenside; break;
        case 'k': pos.castling_ |= kBlackKingside; break;
        case 'q': pos.castling_ |= kBlackQueenside; break;
        default: return std::nullopt;
      }
    }
  }

  if (fields[3] != "-") {
    auto ep = ParseSquare(fields[3]);
    if (!ep) {
      return std::nullopt;
    }
    pos.en_passant_ = *ep;
  }

  if (fields.size() >= 5) {
    auto halfmove = ParseCounter(fields[4]);
    if (!halfmove) {
      return std::nullopt;
    }
    pos.halfmove_clock_ = *halfmove;
  }
  if (fields.size() == 6) {
    auto fullmove = ParseCounter(fields[5]);
    if (!fullmove || *fullmove == 0) {
      return std::nullopt;
    }
    pos.fullmove_number_ = *fullmove;
  }

  for (Color color : {Color::kWhite, Color::kBlack}) {
    auto kings = std::count(pos.board_.begin(), pos.board_.end(), Piece{PieceType::kKing, color});
    if (kings != 1) {
      return std::nullopt;
    }
  }
  return pos;
}

std::string Position::ToFen() const {
  std::string fen = PlacementField();
  fen += side_to_move_ == Color::kWhite ? " w " : " b ";
  fen += CastlingField();
  Square ep = LegalEnPassantSquare();
  fen += ' ';
  fen += ep == kNoSquare ? std::string{"-"} : SquareName(ep);
  fen += ' ' + std::to_string(halfmove_clock_) + ' ' + std::to_string(fullmove_number_);
  return fen;
}

std::string Position::PlacementField() const {
  std::string out;
  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      Piece piece = board_[MakeSquare(file, rank)];
      if (piece.Empty()) {
        ++empty;
        continue;
      }
      if (empty > 0) {
        out.push_back(static_cast<char>('0' + empty));
        empty = 0;
      }
      out.push_back(PieceChar(piece));
    }
    if (empty > 0) {
      out.push_back(static_cast<char>('0' + empty));
    }
    if (rank > 0) {
      out.push_back('/');
    }
  }
  return out;
}

std::string Position::CastlingField() const {
  std::string out;
  if (castling_ & kWhiteKingside) out.push_back('K');
  if (castling_ & kWhiteQueenside) out.push_back('Q');
  if (castling_ & kBlackKingside) out.push_back('k');
  if (castling_ & kBlackQueenside) out.push_back('q');
  return out.empty() ? std::string{"-"} : out;
}

std::string Position::RepetitionKey() const {
  Square ep = LegalEnPassantSquare();
  std::string key = PlacementField();
  key += side_to_move_ == Color::kWhite ? " w " : " b ";
  key += CastlingField();
  key += ' ';
  key += ep == kNoSquare ? std::string{"-"} : SquareName(ep);
  return key;
}

Square Position::KingSquare(Color color) const {
  for (Square sq = 0; sq < 64; ++sq) {
    if (board_[sq] == Piece{PieceType::kKing, color}) {
      return sq;
    }
  }
  return kNoSquare;
}

bool Position::IsAttacked(Square square, Color by) const {
  int file = FileOf(square);
  int rank = RankOf(square);

  int pawn_rank = rank - Forward(by);
  for (int df : {-1, 1}) {
    if (OnBoard(file + df, pawn_rank) &&
        board_[MakeSquare(file + df, pawn_rank)] == Piece{PieceType::kPawn, by}) {
      return true;
    }
  }
  for (const auto& step : kKnightSteps) {
    int f = file + step[0];
    int r = rank + step[1];
    if (OnBoard(f, r) && board_[MakeSquare(f, r)] == Piece{PieceType::kKnight, by}) {
      return true;
    }
  }
  for (const auto& step : kKingSteps) {
    int f = file + step[0];
    int r = rank + step[1];
    if (OnBoard(f, r) && board_[MakeSquare(f, r)] == Piece{PieceType::kKing, by}) {
      return true;
    }
  }

  auto slides_into = [&](const int (*dirs)[2], PieceType slider) {
    for (int i = 0; i < 4; ++i) {
      int f = file + dirs[i][0];
      int r = rank + dirs[i][1];
      while (OnBoard(f, r)) {
        Piece piece = board_[MakeSquare(f, r)];
        if (!piece.Empty()) {
          if (piece.color == by && (piece.type == slider || piece.type == PieceType::kQueen)) {
            return true;
          }
          break;
        }
        f += dirs[i][0];
        r += dirs[i][1];
      }
    }
    return false;
  };
  return slides_into(kRookDirs, PieceType::kRook) || slides_into(kBishopDirs, PieceType::kBishop);
}

bool Position::InCheck() const {
  Square king = KingSquare(side_to_move_);
  return king != kNoSquare && IsAttacked(king, Opposite(side_to_move_));
}

void Position::AddPawnMoves(Square from, std::vector<Move>& out) const {
  const int forward = Forward(side_to_move_);
  const int start_rank = side_to_move_ == Color::kWhite ? 1 : 6;
  const int promotion_rank = side_to_move_ == Color::kWhite ? 7 : 0;
  const int file = FileOf(from);
  const int rank = RankOf(from);

  auto push = [&](Square to) {
    if (RankOf(to) == promotion_rank) {
      for (PieceType promo : kPromotionTypes) {
        out.push_back(Move{from, to, promo});
      }
    } else {
      out.push_back(Move{from, to});
    }
  };

  if (OnBoard(file, rank + forward) && board_[MakeSquare(file, rank + forward)].Empty()) {
    push(MakeSquare(file, rank + forward));
    if (rank == start_rank && board_[MakeSquare(file, rank + 2 * forward)].Empty()) {
      out.push_back(Move{from, MakeSquare(file, rank + 2 * forward)});
    }
  }
  for (int df : {-1, 1}) {
    if (!OnBoard(file + df, rank + forward)) {
      continue;
    }
    Square to = MakeSquare(file + df, rank + forward);
    Piece target = board_[to];
    if (!target.Empty() && target.color != side_to_move_) {
      push(to);
    } else if (target.Empty() && to == en_passant_) {
      out.push_back(Move{from, to});
    }
  }
}

void Position::AddStepMoves(Square from, const int (*steps)[2], int count, std::vector<Move>& out) const {
  for (int i = 0; i < count; ++i) {
    int f = FileOf(from) + steps[i][0];
    int r = RankOf(from) + steps[i][1];
    if (!OnBoard(f, r)) {
      continue;
    }
    Piece target = board_[MakeSquare(f, r)];
    if (target.Empty() || target.color != side_to_move_) {
      out.push_back(Move{from, MakeSquare(f, r)});
    }
  }
}

void Position::AddSlidingMoves(Square from, const int (*dirs)[2], int count, std::vector<Move>& out) const {
  for (int i = 0; i < count; ++i) {
    int f = FileOf(from) + dirs[i][0];
    int r = RankOf(from) + dirs[i][1];
    while (OnBoard(f, r)) {
      Piece target = board_[MakeSquare(f, r)];
      if (!target.Empty()) {
        if (target.color != side_to_move_) {
          out.push_back(Move{from, MakeSquare(f, r)});
        }
        break;
      }
      out.push_back(Move{from, MakeSquare(f, r)});
      f += dirs[i][0];
      r += dirs[i][1];
    }
  }
}

void Position::AddCastlingMoves(Square from, std::vector<Move>& out) const {
  const int back = BackRank(side_to_move_);
  if (from != MakeSquare(4, back) || InCheck()) {
    return;
  }
  const Color enemy = Opposite(side_to_move_);
  const Piece rook{PieceType::kRook, side_to_move_};
  const std::uint8_t kingside = side_to_move_ == Color::kWhite ? kWhiteKingside : kBlackKingside;
  const std::uint8_t queenside = side_to_move_ == Color::kWhite ? kWhiteQueenside : kBlackQueenside;

  if ((castling_ & kingside) && board_[MakeSquare(7, back)] == rook && board_[MakeSquare(5, back)].Empty() &&
      board_[MakeSquare(6, back)].Empty() && !IsAttacked(MakeSquare(5, back), enemy) &&
      !IsAttacked(MakeSquare(6, back), enemy)) {
    out.push_back(Move{from, MakeSquare(6, back)});
  }
  if ((castling_ & queenside) && board_[MakeSquare(0, back)] == rook && board_[MakeSquare(1, back)].Empty() &&
      board_[MakeSquare(2, back)].Empty() && board_[MakeSquare(3, back)].Empty() &&
      !IsAttacked(MakeSquare(3, back), enemy) && !IsAttacked(MakeSquare(2, back), enemy)) {
    out.push_back(Move{from, MakeSquare(2, back)});
  }
}

std::vector<Move> Position::PseudoLegalMoves() const {
  std::vector<Move> moves;
  moves.reserve(64);
  for (Square sq = 0; sq < 64; ++sq) {
    Piece piece = board_[sq];
    if (piece.Empty() || piece.color != side_to_move_) {
      continue;
    }
    switch (piece.type) {
      case PieceType::kPawn:
        AddPawnMoves(sq, moves);
        break;
      case PieceType::kKnight:
        AddStepMoves(sq, kKnightSteps, 8, moves);
        break;
      case PieceType::kBishop:
        AddSlidingMoves(sq, kBishopDirs, 4, moves);
        break;
      case PieceType::kRook:
        AddSlidingMoves(sq, kRookDirs, 4, moves);
        break;
      case PieceType::kQueen:
        AddSlidingMoves(sq, kBishopDirs, 4, moves);
        AddSlidingMoves(sq, kRookDirs, 4, moves);
        break;
      case PieceType::kKing:
        AddStepMoves(sq, kKingSteps, 8, moves);
        AddCastlingMoves(sq, moves);
        break;
      case PieceType::kNone:
        break;
    }
  }
  return moves;
}

void Position::MovePiece(const Move& move) {
  Piece piece = board_[move.from];
  if (piece.type == PieceType::kPawn && move.to == en_passant_ && FileOf(move.from) != FileOf(move.to) &&
      board_[move.to].Empty()) {
    board_[MakeSquare(FileOf(move.to), RankOf(move.from))] = Piece{};
  }
  if (piece.type == PieceType::kKing && std::abs(FileOf(move.to) - FileOf(move.from)) == 2) {
    const int back = RankOf(move.from);
    const bool kingside = FileOf(move.to) == 6;
    Square rook_from = MakeSquare(kingside ? 7 : 0, back);
    Square rook_to = MakeSquare(kingside ? 5 : 3, back);
    board_[rook_to] = board_[rook_from];
    board_[rook_from] = Piece{};
  }
  if (move.promotion != PieceType::kNone) {
    piece.type = move.promotion;
  }
  board_[move.to] = piece;
  board_[move.from] = Piece{};
}

bool Position::LeavesKingSafe(const Move& move) const {
  Position scratch;
  scratch.board_ = board_;
  scratch.en_passant_ = en_passant_;
  scratch.MovePiece(move);
  Square king = scratch.KingSquare(side_to_move_);
  return king != kNoSquare && !scratch.IsAttacked(king, Opposite(side_to_move_));
}

std::vector<Move> Position::LegalMoves() const {
  auto moves = PseudoLegalMoves();
  moves.erase(std::remove_if(moves.begin(), moves.end(), [this](const Move& m) { return !LeavesKingSafe(m); }),
              moves.end());
  return moves;
}

bool Position::IsLegal(const Move& move) const {
  if (move.from < 0 || move.from >= 64 || move.to < 0 || move.to >= 64) {
    return false;
  }
  Piece piece = board_[move.from];
  if (piece.Empty() || piece.color != side_to_move_) {
    return false;
  }
  auto moves = LegalMoves();
  return std::find(moves.begin(), moves.end(), move) != moves.end();
}

Square Position::LegalEnPassantSquare() const {
  if (en_passant_ == kNoSquare) {
    return kNoSquare;
  }
  const int from_rank = RankOf(en_passant_) - Forward(side_to_move_);
  for (int df : {-1, 1}) {
    int file = FileOf(en_passant_) + df;
    if (!OnBoard(file, from_rank)) {
      continue;
    }
    Square from = MakeSquare(file, from_rank);
    if (board_[from] == Piece{PieceType::kPawn, side_to_move_} && LeavesKingSafe(Move{from, en_passant_})) {
      return en_passant_;
    }
  }
  return kNoSquare;
}

void Position::Play(const Move& move) {
  const Piece piece = board_[move.from];
  const bool capture = !board_[move.to].Empty() || (piece.type == PieceType::kPawn && move.to == en_passant_);
  const bool zeroing = capture || piece.type == PieceType::kPawn;
  std::string previous_key = RepetitionKey();

  MovePiece(move);

  if (piece.type == PieceType::kKing) {
    castling_ &= side_to_move_ == Color::kWhite
                     ? static_cast<std::uint8_t>(~(kWhiteKingside | kWhiteQueenside))
                     : static_cast<std::uint8_t>(~(kBlackKingside | kBlackQueenside));
  }
  for (Square sq : {move.from, move.to}) {
    if (sq == MakeSquare(0, 0)) castling_ &= static_cast<std::uint8_t>(~kWhiteQueenside);
    if (sq == MakeSquare(7, 0)) castling_ &= static_cast<std::uint8_t>(~kWhiteKingside);
    if (sq == MakeSquare(0, 7)) castling_ &= static_cast<std::uint8_t>(~kBlackQueenside);
    if (sq == MakeSquare(7, 7)) castling_ &= static_cast<std::uint8_t>(~kBlackKingside);
  }

  en_passant_ = kNoSquare;
  if (piece.type == PieceType::kPawn && std::abs(RankOf(move.to) - RankOf(move.from)) == 2) {
    en_passant_ = MakeSquare(FileOf(move.from), (RankOf(move.from) + RankOf(move.to)) / 2);
  }

  halfmove_clock_ = zeroing ? 0 : halfmove_clock_ + 1;
  if (side_to_move_ == Color::kBlack) {
    ++fullmove_number_;
  }
  side_to_move_ = Opposite(side_to_move_);

  if (zeroing) {
    history_.clear();
  } else {
    history_.push_back(std::move(previous_key));
  }
}

int Position::RepetitionCount() const {
  auto key = RepetitionKey();
  return 1 + static_cast<int>(std::count(history_.begin(), history_.end(), key));
}

bool Position::HasInsufficientMaterial(Color color) const {
  int own_pieces = 0;
  bool own_knight = false;
  bool own_bishop = false;
  bool enemy_minor_or_rook = false;
  bool any_pawn = false;
  bool any_knight = false;
  bool bishop_on_dark = false;
  bool bishop_on_light = false;

  for (Square sq = 0; sq < 64; ++sq) {
    Piece piece = board_[sq];
    if (piece.Empty()) {
      continue;
    }
    if (piece.type == PieceType::kPawn) any_pawn = true;
    if (piece.type == PieceType::kKnight) any_knight = true;
    if (piece.type == PieceType::kBishop) {
      (IsDarkSquare(sq) ? bishop_on_dark : bishop_on_light) = true;
    }
    if (piece.color == color) {
      ++own_pieces;
      switch (piece.type) {
        case PieceType::kPawn:
        case PieceType::kRook:
        case PieceType::kQueen:
          return false;
        case PieceType::kKnight: own_knight = true; break;
        case PieceType::kBishop: own_bishop = true; break;
        default: break;
      }
    } else if (piece.type != PieceType::kKing && piece.type != PieceType::kQueen) {
      enemy_minor_or_rook = true;
    }
  }

  if (own_knight) {
    return own_pieces <= 2 && !enemy_minor_or_rook;
  }
  if (own_bishop) {
    bool same_color = !(bishop_on_dark && bishop_on_light);
    return same_color && !any_pawn && !any_knight;
  }
  return true;
}

bool Position::IsInsufficientMaterial() const {
  return HasInsufficientMaterial(Color::kWhite) && HasInsufficientMaterial(Color::kBlack);
}

}  // namespace chessroom
