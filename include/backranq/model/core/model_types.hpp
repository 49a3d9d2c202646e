#pragma once
#include <cstdint>

#include "../../chess_types.hpp"

namespace backranq::model::bb {

struct Piece {
  core::PieceType type = core::PieceType::None;
  core::Color color = core::Color::White;
  [[nodiscard]] constexpr bool isNone() const noexcept { return type == core::PieceType::None; }
  [[nodiscard]] constexpr bool is(core::Color c, core::PieceType t) const noexcept {
    return type == t && color == c;
  }
};

[[nodiscard]] constexpr int ci(core::Color c) noexcept {
  return c == core::Color::White ? 0 : 1;
}

constexpr core::Square A1 = 0, C1 = 2, D1 = 3, E1 = 4, F1 = 5, G1 = 6, H1 = 7;
constexpr core::Square A8 = 56, C8 = 58, D8 = 59, E8 = 60, F8 = 61, G8 = 62, H8 = 63;

enum Castling : std::uint8_t { WK = 1 << 0, WQ = 1 << 1, BK = 1 << 2, BQ = 1 << 3 };

}  // namespace backranq::model::bb
