#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "core/model_types.hpp"

namespace backranq::model {

// 8x8 mailbox; square index = rank * 8 + file, a1 = 0.
class Board {
 public:
  Board() { clear(); }

  void clear() noexcept {
    m_squares.fill(bb::Piece{});
    m_kings = {core::NO_SQUARE, core::NO_SQUARE};
  }

  void setPiece(core::Square sq, bb::Piece p) noexcept {
    m_squares[sq] = p;
    if (p.type == core::PieceType::King) m_kings[bb::ci(p.color)] = sq;
  }

  void removePiece(core::Square sq) noexcept {
    const bb::Piece p = m_squares[sq];
    if (p.type == core::PieceType::King && m_kings[bb::ci(p.color)] == sq)
      m_kings[bb::ci(p.color)] = core::NO_SQUARE;
    m_squares[sq] = bb::Piece{};
  }

  [[nodiscard]] std::optional<bb::Piece> getPiece(core::Square sq) const noexcept {
    if (!core::validSquare(sq) || m_squares[sq].isNone()) return std::nullopt;
    return m_squares[sq];
  }

  [[nodiscard]] const bb::Piece& at(core::Square sq) const noexcept { return m_squares[sq]; }

  [[nodiscard]] core::Square kingSquare(core::Color c) const noexcept {
    return m_kings[bb::ci(c)];
  }

  // Material in pawn units for one side.
  [[nodiscard]] int material(core::Color c) const noexcept {
    int sum = 0;
    for (const auto& p : m_squares)
      if (!p.isNone() && p.color == c) sum += core::pieceValue(p.type);
    return sum;
  }

  [[nodiscard]] int nonKingPieceCount() const noexcept {
    int n = 0;
    for (const auto& p : m_squares)
      if (!p.isNone() && p.type != core::PieceType::King) ++n;
    return n;
  }

  // Knights, bishops, rooks and queens in pawn units, both sides together.
  [[nodiscard]] int nonPawnMaterial() const noexcept {
    int sum = 0;
    for (const auto& p : m_squares)
      if (!p.isNone() && p.type != core::PieceType::Pawn) sum += core::pieceValue(p.type);
    return sum;
  }

 private:
  std::array<bb::Piece, 64> m_squares{};
  std::array<core::Square, 2> m_kings{core::NO_SQUARE, core::NO_SQUARE};
};

}  // namespace backranq::model
