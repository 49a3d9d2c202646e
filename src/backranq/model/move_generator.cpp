#include "backranq/model/move_generator.hpp"

namespace backranq::model {

namespace {

constexpr int KNIGHT_DELTAS[8][2] = {{1, 2},  {2, 1},  {2, -1}, {1, -2},
                                     {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
constexpr int KING_DELTAS[8][2] = {{1, 0},  {1, 1},   {0, 1},  {-1, 1},
                                   {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
constexpr int BISHOP_DIRS[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
constexpr int ROOK_DIRS[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

inline core::Square offset(core::Square sq, int df, int dr) noexcept {
  return core::makeSquare(core::file_of(sq) + df, core::rank_of(sq) + dr);
}

inline void addPawnMove(core::Square from, core::Square to, bool capture, bool promote,
                        std::vector<Move>& out) {
  if (!promote) {
    out.emplace_back(from, to, core::PieceType::None, capture);
    return;
  }
  for (auto p : {core::PieceType::Queen, core::PieceType::Rook, core::PieceType::Bishop,
                 core::PieceType::Knight})
    out.emplace_back(from, to, p, capture);
}

bool rayHits(const Board& board, core::Square sq, const int (*dirs)[2], core::Color by,
             core::PieceType a, core::PieceType b) noexcept {
  for (int d = 0; d < 4; ++d) {
    core::Square cur = offset(sq, dirs[d][0], dirs[d][1]);
    while (core::validSquare(cur)) {
      const bb::Piece& p = board.at(cur);
      if (!p.isNone()) {
        if (p.color == by && (p.type == a || p.type == b)) return true;
        break;
      }
      cur = offset(cur, dirs[d][0], dirs[d][1]);
    }
  }
  return false;
}

}  // namespace

bool MoveGenerator::isSquareAttacked(const Board& board, core::Square sq,
                                     core::Color by) noexcept {
  if (!core::validSquare(sq)) return false;

  // A pawn of 'by' attacks sq from one rank behind it (from by's point of view).
  const int pawnRank = (by == core::Color::White) ? -1 : 1;
  for (int df : {-1, 1}) {
    const core::Square s = offset(sq, df, pawnRank);
    if (core::validSquare(s) && board.at(s).is(by, core::PieceType::Pawn)) return true;
  }

  for (const auto& d : KNIGHT_DELTAS) {
    const core::Square s = offset(sq, d[0], d[1]);
    if (core::validSquare(s) && board.at(s).is(by, core::PieceType::Knight)) return true;
  }
  for (const auto& d : KING_DELTAS) {
    const core::Square s = offset(sq, d[0], d[1]);
    if (core::validSquare(s) && board.at(s).is(by, core::PieceType::King)) return true;
  }

  return rayHits(board, sq, BISHOP_DIRS, by, core::PieceType::Bishop, core::PieceType::Queen) ||
         rayHits(board, sq, ROOK_DIRS, by, core::PieceType::Rook, core::PieceType::Queen);
}

void MoveGenerator::generatePseudoLegalMoves(const Board& board, const GameState& st,
                                             std::vector<Move>& out) const {
  const core::Color us = st.sideToMove;
  for (core::Square sq = 0; sq < 64; ++sq) {
    const bb::Piece& p = board.at(sq);
    if (p.isNone() || p.color != us) continue;

    switch (p.type) {
      case core::PieceType::Pawn:
        genPawnMoves(board, st, sq, out);
        break;
      case core::PieceType::Knight:
        genStepMoves(board, sq, KNIGHT_DELTAS, 8, out);
        break;
      case core::PieceType::Bishop:
        genSliderMoves(board, sq, BISHOP_DIRS, 4, out);
        break;
      case core::PieceType::Rook:
        genSliderMoves(board, sq, ROOK_DIRS, 4, out);
        break;
      case core::PieceType::Queen:
        genSliderMoves(board, sq, BISHOP_DIRS, 4, out);
        genSliderMoves(board, sq, ROOK_DIRS, 4, out);
        break;
      case core::PieceType::King:
        genStepMoves(board, sq, KING_DELTAS, 8, out);
        break;
      default:
        break;
    }
  }
  genCastling(board, st, out);
}

void MoveGenerator::genPawnMoves(const Board& board, const GameState& st, core::Square from,
                                 std::vector<Move>& out) const {
  const core::Color us = st.sideToMove;
  const int dr = (us == core::Color::White) ? 1 : -1;
  const int startRank = (us == core::Color::White) ? 1 : 6;
  const int promoRank = (us == core::Color::White) ? 7 : 0;

  const core::Square one = offset(from, 0, dr);
  if (core::validSquare(one) && board.at(one).isNone()) {
    addPawnMove(from, one, false, core::rank_of(one) == promoRank, out);
    if (core::rank_of(from) == startRank) {
      const core::Square two = offset(from, 0, 2 * dr);
      if (core::validSquare(two) && board.at(two).isNone())
        out.emplace_back(from, two);
    }
  }

  for (int df : {-1, 1}) {
    const core::Square to = offset(from, df, dr);
    if (!core::validSquare(to)) continue;
    const bb::Piece& target = board.at(to);
    if (!target.isNone() && target.color != us) {
      addPawnMove(from, to, true, core::rank_of(to) == promoRank, out);
    } else if (target.isNone() && to == st.enPassantSquare) {
      out.emplace_back(from, to, core::PieceType::None, true, true);
    }
  }
}

void MoveGenerator::genStepMoves(const Board& board, core::Square from, const int (*deltas)[2],
                                 int count, std::vector<Move>& out) const {
  const core::Color us = board.at(from).color;
  for (int i = 0; i < count; ++i) {
    const core::Square to = offset(from, deltas[i][0], deltas[i][1]);
    if (!core::validSquare(to)) continue;
    const bb::Piece& target = board.at(to);
    if (target.isNone())
      out.emplace_back(from, to);
    else if (target.color != us)
      out.emplace_back(from, to, core::PieceType::None, true);
  }
}

void MoveGenerator::genSliderMoves(const Board& board, core::Square from, const int (*dirs)[2],
                                   int count, std::vector<Move>& out) const {
  const core::Color us = board.at(from).color;
  for (int i = 0; i < count; ++i) {
    core::Square to = offset(from, dirs[i][0], dirs[i][1]);
    while (core::validSquare(to)) {
      const bb::Piece& target = board.at(to);
      if (target.isNone()) {
        out.emplace_back(from, to);
      } else {
        if (target.color != us) out.emplace_back(from, to, core::PieceType::None, true);
        break;
      }
      to = offset(to, dirs[i][0], dirs[i][1]);
    }
  }
}

void MoveGenerator::genCastling(const Board& board, const GameState& st,
                                std::vector<Move>& out) const {
  const core::Color us = st.sideToMove;
  const core::Color them = ~us;
  const bool white = (us == core::Color::White);
  const core::Square kingSq = white ? bb::E1 : bb::E8;
  if (!board.at(kingSq).is(us, core::PieceType::King)) return;
  if (isSquareAttacked(board, kingSq, them)) return;

  const std::uint8_t kRight = white ? bb::Castling::WK : bb::Castling::BK;
  const std::uint8_t qRight = white ? bb::Castling::WQ : bb::Castling::BQ;

  if (st.castlingRights & kRight) {
    const core::Square f = white ? bb::F1 : bb::F8;
    const core::Square g = white ? bb::G1 : bb::G8;
    const core::Square h = white ? bb::H1 : bb::H8;
    if (board.at(h).is(us, core::PieceType::Rook) && board.at(f).isNone() &&
        board.at(g).isNone() && !isSquareAttacked(board, f, them) &&
        !isSquareAttacked(board, g, them))
      out.emplace_back(kingSq, g, core::PieceType::None, false, false, CastleSide::KingSide);
  }

  if (st.castlingRights & qRight) {
    const core::Square d = white ? bb::D1 : bb::D8;
    const core::Square c = white ? bb::C1 : bb::C8;
    const core::Square b = static_cast<core::Square>(c - 1);
    const core::Square a = white ? bb::A1 : bb::A8;
    if (board.at(a).is(us, core::PieceType::Rook) && board.at(d).isNone() &&
        board.at(c).isNone() && board.at(b).isNone() && !isSquareAttacked(board, d, them) &&
        !isSquareAttacked(board, c, them))
      out.emplace_back(kingSq, c, core::PieceType::None, false, false, CastleSide::QueenSide);
  }
}

}  // namespace backranq::model
