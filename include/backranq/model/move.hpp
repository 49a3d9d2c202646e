#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include "core/model_types.hpp"

namespace backranq::model {

enum class CastleSide : std::uint8_t { None = 0, KingSide = 1, QueenSide = 2 };

struct Move {
  core::Square m_from{0};
  core::Square m_to{0};
  core::PieceType m_promotion{core::PieceType::None};
  bool m_capture{false};
  bool m_ep{false};
  CastleSide m_castle{CastleSide::None};

  constexpr Move() noexcept = default;

  constexpr Move(core::Square f, core::Square t, core::PieceType promo = core::PieceType::None,
                 bool isCap = false, bool isEP = false, CastleSide cs = CastleSide::None) noexcept
      : m_from(f), m_to(t), m_promotion(promo), m_capture(isCap), m_ep(isEP), m_castle(cs) {}

  [[nodiscard]] constexpr core::Square from() const noexcept { return m_from; }
  [[nodiscard]] constexpr core::Square to() const noexcept { return m_to; }
  [[nodiscard]] constexpr core::PieceType promotion() const noexcept { return m_promotion; }
  [[nodiscard]] constexpr bool isCapture() const noexcept { return m_capture; }
  [[nodiscard]] constexpr bool isEnPassant() const noexcept { return m_ep; }
  [[nodiscard]] constexpr CastleSide castle() const noexcept { return m_castle; }
  [[nodiscard]] constexpr bool isCastle() const noexcept { return m_castle != CastleSide::None; }
  [[nodiscard]] constexpr bool isNull() const noexcept { return m_from == m_to; }

  // Equality: from/to/promotion only
  friend constexpr bool operator==(const Move& a, const Move& b) noexcept {
    return a.m_from == b.m_from && a.m_to == b.m_to && a.m_promotion == b.m_promotion;
  }
  friend constexpr bool operator!=(const Move& a, const Move& b) noexcept { return !(a == b); }
};

static_assert(std::is_trivially_copyable_v<Move>, "Move must be trivially copyable");

// "e7e8q" style text; promotion letter is always lowercase.
std::string toUci(const Move& m);

// Parses the coordinate part only; flags are resolved against a position by ChessGame.
bool parseUciCoords(std::string_view uci, core::Square& from, core::Square& to,
                    core::PieceType& promo);

// Trim plus lowercase, the canonical form used for comparisons everywhere.
std::string normalizeUci(std::string_view raw);

}  // namespace backranq::model
