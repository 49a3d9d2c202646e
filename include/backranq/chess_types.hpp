#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace backranq::core
{
  using Square = std::uint8_t;
  constexpr Square NO_SQUARE = 64;

  inline bool validSquare(core::Square sq)
  {
    return sq < core::NO_SQUARE;
  }

  constexpr std::uint8_t NUM_PIECE_TYPES = 6;
  enum class PieceType : std::uint8_t
  {
    Pawn = 0,
    Knight,
    Bishop,
    Rook,
    Queen,
    King,
    None
  };

  constexpr int idx(PieceType p) noexcept
  {
    return static_cast<int>(p);
  }

  enum class Color : std::uint8_t
  {
    White = 0,
    Black = 1
  };
  constexpr inline core::Color operator~(core::Color c)
  {
    return c == core::Color::White ? core::Color::Black : core::Color::White;
  }

  constexpr int file_of(Square s) noexcept
  {
    return s & 7;
  }
  constexpr int rank_of(Square s) noexcept
  {
    return s >> 3;
  }
  constexpr Square makeSquare(int file, int rank) noexcept
  {
    return (file < 0 || file > 7 || rank < 0 || rank > 7) ? NO_SQUARE
                                                          : static_cast<Square>(rank * 8 + file);
  }

  // "e4" -> 28, NO_SQUARE when malformed.
  inline Square parseSquare(std::string_view sv) noexcept
  {
    if (sv.size() < 2)
      return NO_SQUARE;
    return makeSquare(sv[0] - 'a', sv[1] - '1');
  }

  inline std::string squareName(Square s)
  {
    if (!validSquare(s))
      return "-";
    std::string out;
    out.push_back(char('a' + file_of(s)));
    out.push_back(char('1' + rank_of(s)));
    return out;
  }

  // Material in pawn units (king counts zero).
  constexpr int pieceValue(PieceType p) noexcept
  {
    switch (p)
    {
    case PieceType::Pawn:
      return 1;
    case PieceType::Knight:
    case PieceType::Bishop:
      return 3;
    case PieceType::Rook:
      return 5;
    case PieceType::Queen:
      return 9;
    default:
      return 0;
    }
  }

  inline char colorChar(Color c)
  {
    return c == Color::White ? 'w' : 'b';
  }
} // namespace backranq::core
