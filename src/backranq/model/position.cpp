#include "backranq/model/position.hpp"

#include "backranq/model/move_generator.hpp"

namespace backranq::model {

namespace {

inline core::Square rookFrom(CastleSide cs, int rank) noexcept {
  return core::makeSquare(cs == CastleSide::KingSide ? 7 : 0, rank);
}
inline core::Square rookTo(CastleSide cs, int rank) noexcept {
  return core::makeSquare(cs == CastleSide::KingSide ? 5 : 3, rank);
}

}  // namespace

bool Position::isKingInCheck(core::Color c) const {
  const core::Square k = m_board.kingSquare(c);
  return core::validSquare(k) && MoveGenerator::isSquareAttacked(m_board, k, ~c);
}

bool Position::inCheck() const {
  return isKingInCheck(m_state.sideToMove);
}

void Position::updateCastlingRights(core::Square from, core::Square to) {
  auto clearFor = [&](core::Square sq) {
    switch (sq) {
      case bb::E1:
        m_state.castlingRights &= ~(bb::Castling::WK | bb::Castling::WQ);
        break;
      case bb::E8:
        m_state.castlingRights &= ~(bb::Castling::BK | bb::Castling::BQ);
        break;
      case bb::H1:
        m_state.castlingRights &= ~bb::Castling::WK;
        break;
      case bb::A1:
        m_state.castlingRights &= ~bb::Castling::WQ;
        break;
      case bb::H8:
        m_state.castlingRights &= ~bb::Castling::BK;
        break;
      case bb::A8:
        m_state.castlingRights &= ~bb::Castling::BQ;
        break;
      default:
        break;
    }
  };
  clearFor(from);
  clearFor(to);
}

bool Position::doMove(const Move& m) {
  const bb::Piece moved = m_board.at(m.from());
  if (moved.isNone() || moved.color != m_state.sideToMove) return false;

  StateInfo st{};
  st.move = m;
  st.moved = moved;
  st.prevState = m_state;

  const core::Color us = moved.color;

  if (m.isEnPassant()) {
    st.capturedSquare = core::makeSquare(core::file_of(m.to()), core::rank_of(m.from()));
  } else if (!m_board.at(m.to()).isNone()) {
    st.capturedSquare = m.to();
  }
  if (core::validSquare(st.capturedSquare)) {
    st.captured = m_board.at(st.capturedSquare);
    m_board.removePiece(st.capturedSquare);
  }

  m_board.removePiece(m.from());
  bb::Piece placed = moved;
  if (m.promotion() != core::PieceType::None) placed.type = m.promotion();
  m_board.setPiece(m.to(), placed);

  if (m.isCastle()) {
    const int rank = core::rank_of(m.from());
    const core::Square rf = rookFrom(m.castle(), rank);
    const bb::Piece rook = m_board.at(rf);
    m_board.removePiece(rf);
    m_board.setPiece(rookTo(m.castle(), rank), rook);
  }

  updateCastlingRights(m.from(), m.to());

  m_state.enPassantSquare = core::NO_SQUARE;
  if (moved.type == core::PieceType::Pawn) {
    const int dr = core::rank_of(m.to()) - core::rank_of(m.from());
    if (dr == 2 || dr == -2)
      m_state.enPassantSquare =
          core::makeSquare(core::file_of(m.from()), core::rank_of(m.from()) + dr / 2);
  }

  if (moved.type == core::PieceType::Pawn || !st.captured.isNone())
    m_state.halfmoveClock = 0;
  else
    ++m_state.halfmoveClock;

  if (us == core::Color::Black) ++m_state.fullmoveNumber;
  m_state.sideToMove = ~us;

  m_history.push_back(st);

  if (isKingInCheck(us)) {
    undoMove();
    return false;
  }
  return true;
}

void Position::undoMove() {
  if (m_history.empty()) return;
  const StateInfo st = m_history.back();
  m_history.pop_back();

  const Move& m = st.move;
  m_board.removePiece(m.to());
  m_board.setPiece(m.from(), st.moved);

  if (m.isCastle()) {
    const int rank = core::rank_of(m.from());
    const core::Square rt = rookTo(m.castle(), rank);
    const bb::Piece rook = m_board.at(rt);
    m_board.removePiece(rt);
    m_board.setPiece(rookFrom(m.castle(), rank), rook);
  }

  if (core::validSquare(st.capturedSquare)) m_board.setPiece(st.capturedSquare, st.captured);

  m_state = st.prevState;
}

}  // namespace backranq::model
