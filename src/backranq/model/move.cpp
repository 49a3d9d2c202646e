#include "backranq/model/move.hpp"

#include <cctype>

namespace backranq::model {

namespace {

inline char promoChar(core::PieceType p) noexcept {
  switch (p) {
    case core::PieceType::Queen:
      return 'q';
    case core::PieceType::Rook:
      return 'r';
    case core::PieceType::Bishop:
      return 'b';
    case core::PieceType::Knight:
      return 'n';
    default:
      return '\0';
  }
}

inline core::PieceType promoFromChar(char c) noexcept {
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'q':
      return core::PieceType::Queen;
    case 'r':
      return core::PieceType::Rook;
    case 'b':
      return core::PieceType::Bishop;
    case 'n':
      return core::PieceType::Knight;
    default:
      return core::PieceType::None;
  }
}

}  // namespace

std::string toUci(const Move& m) {
  std::string s = core::squareName(m.from()) + core::squareName(m.to());
  const char p = promoChar(m.promotion());
  if (p) s.push_back(p);
  return s;
}

bool parseUciCoords(std::string_view uci, core::Square& from, core::Square& to,
                    core::PieceType& promo) {
  if (uci.size() != 4 && uci.size() != 5) return false;
  from = core::parseSquare(uci.substr(0, 2));
  to = core::parseSquare(uci.substr(2, 2));
  if (!core::validSquare(from) || !core::validSquare(to)) return false;
  promo = core::PieceType::None;
  if (uci.size() == 5) {
    promo = promoFromChar(uci[4]);
    if (promo == core::PieceType::None) return false;
  }
  return true;
}

std::string normalizeUci(std::string_view raw) {
  std::size_t a = 0, b = raw.size();
  while (a < b && std::isspace(static_cast<unsigned char>(raw[a]))) ++a;
  while (b > a && std::isspace(static_cast<unsigned char>(raw[b - 1]))) --b;
  std::string out;
  out.reserve(b - a);
  for (std::size_t i = a; i < b; ++i)
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(raw[i]))));
  return out;
}

}  // namespace backranq::model
