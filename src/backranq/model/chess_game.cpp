#include "backranq/model/chess_game.hpp"

#include <cctype>
#include <optional>
#include <string_view>

namespace backranq::model {

namespace {

inline char tolower_ascii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | 32) : c;
}

inline bool parseUInt(std::string_view sv, int& out) noexcept {
  if (sv.empty()) return false;
  int val = 0;
  for (char c : sv) {
    if (c < '0' || c > '9') return false;
    val = val * 10 + (c - '0');
    if (val > 1000000) return false;
  }
  out = val;
  return true;
}

inline core::PieceType typeFromLetter(char lo) noexcept {
  switch (lo) {
    case 'k':
      return core::PieceType::King;
    case 'q':
      return core::PieceType::Queen;
    case 'r':
      return core::PieceType::Rook;
    case 'b':
      return core::PieceType::Bishop;
    case 'n':
      return core::PieceType::Knight;
    case 'p':
      return core::PieceType::Pawn;
    default:
      return core::PieceType::None;
  }
}

inline char letterFor(bb::Piece p) noexcept {
  static constexpr char kLetters[] = {'p', 'n', 'b', 'r', 'q', 'k'};
  const char lo = kLetters[core::idx(p.type)];
  return p.color == core::Color::White ? static_cast<char>(lo - 32) : lo;
}

inline bool fail(std::string* err, const char* msg) {
  if (err) *err = msg;
  return false;
}

}  // namespace

// ---------------- Public API ----------------

ChessGame::ChessGame() {
  m_pseudo_moves.reserve(256);
  m_legal_moves.reserve(256);
  setPosition(core::START_FEN);
}

bool ChessGame::setPosition(const std::string& fen, std::string* err) {
  // Split FEN into 6 fields; the clocks may be missing.
  std::string_view sv{fen};
  std::string_view fields[6]{};
  int nFields = 0;
  while (!sv.empty() && nFields < 6) {
    while (!sv.empty() && sv.front() == ' ') sv.remove_prefix(1);
    if (sv.empty()) break;
    const size_t sp = sv.find(' ');
    fields[nFields++] = sv.substr(0, sp);
    if (sp == std::string_view::npos) break;
    sv.remove_prefix(sp);
  }
  if (nFields < 2) return fail(err, "FEN needs at least placement and side to move");

  Position next;
  Board& board = next.getBoard();
  GameState& st = next.getState();

  // Board placement
  int rank = 7, file = 0;
  int kings[2] = {0, 0};
  for (char ch : fields[0]) {
    if (ch == '/') {
      if (file != 8 || rank == 0) return fail(err, "FEN rank has wrong width");
      file = 0;
      --rank;
      continue;
    }
    if (ch >= '1' && ch <= '8') {
      file += ch - '0';
      if (file > 8) return fail(err, "FEN rank has wrong width");
      continue;
    }
    const char lo = tolower_ascii(ch);
    const core::PieceType type = typeFromLetter(lo);
    if (type == core::PieceType::None) return fail(err, "FEN has an unknown piece letter");
    if (file > 7) return fail(err, "FEN rank has wrong width");
    const core::Color col = (ch == lo) ? core::Color::Black : core::Color::White;
    if (type == core::PieceType::King) ++kings[bb::ci(col)];
    board.setPiece(core::makeSquare(file, rank), {type, col});
    ++file;
  }
  if (rank != 0 || file != 8) return fail(err, "FEN placement must describe 8 ranks");
  if (kings[0] != 1 || kings[1] != 1) return fail(err, "FEN needs exactly one king per side");

  // Active color
  if (fields[1] == "w")
    st.sideToMove = core::Color::White;
  else if (fields[1] == "b")
    st.sideToMove = core::Color::Black;
  else
    return fail(err, "FEN side to move must be 'w' or 'b'");

  // Castling rights; rights without the pieces in place are dropped.
  std::uint8_t rights = 0;
  for (char c : fields[2]) {
    switch (c) {
      case 'K':
        rights |= bb::Castling::WK;
        break;
      case 'Q':
        rights |= bb::Castling::WQ;
        break;
      case 'k':
        rights |= bb::Castling::BK;
        break;
      case 'q':
        rights |= bb::Castling::BQ;
        break;
      case '-':
        break;
      default:
        return fail(err, "FEN castling field is malformed");
    }
  }
  auto keep = [&](std::uint8_t flag, core::Square king, core::Square rook, core::Color c) {
    if ((rights & flag) && !(board.at(king).is(c, core::PieceType::King) &&
                             board.at(rook).is(c, core::PieceType::Rook)))
      rights &= static_cast<std::uint8_t>(~flag);
  };
  keep(bb::Castling::WK, bb::E1, bb::H1, core::Color::White);
  keep(bb::Castling::WQ, bb::E1, bb::A1, core::Color::White);
  keep(bb::Castling::BK, bb::E8, bb::H8, core::Color::Black);
  keep(bb::Castling::BQ, bb::E8, bb::A8, core::Color::Black);
  st.castlingRights = rights;

  // En passant
  st.enPassantSquare = core::NO_SQUARE;
  if (!fields[3].empty() && fields[3] != "-") {
    st.enPassantSquare = core::parseSquare(fields[3]);
    if (!core::validSquare(st.enPassantSquare) || fields[3].size() != 2)
      return fail(err, "FEN en passant square is malformed");
  }

  int hm = 0, fm = 1;
  if (!fields[4].empty() && !parseUInt(fields[4], hm)) return fail(err, "FEN halfmove clock");
  if (!fields[5].empty() && !parseUInt(fields[5], fm)) return fail(err, "FEN fullmove number");
  st.halfmoveClock = static_cast<std::uint16_t>(hm);
  st.fullmoveNumber = static_cast<std::uint32_t>(fm == 0 ? 1 : fm);

  // The side not to move must not be in check.
  if (next.isKingInCheck(~st.sideToMove))
    return fail(err, "FEN leaves the side not to move in check");

  m_position = std::move(next);
  m_pseudo_moves.clear();
  m_legal_moves.clear();
  return true;
}

std::string ChessGame::getFen() const {
  const Board& board = m_position.getBoard();
  const GameState& st = m_position.getState();

  std::string fen;
  fen.reserve(90);
  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      const bb::Piece& p = board.at(core::makeSquare(file, rank));
      if (p.isNone()) {
        ++empty;
        continue;
      }
      if (empty) fen.push_back(static_cast<char>('0' + empty));
      empty = 0;
      fen.push_back(letterFor(p));
    }
    if (empty) fen.push_back(static_cast<char>('0' + empty));
    if (rank) fen.push_back('/');
  }

  fen.push_back(' ');
  fen.push_back(core::colorChar(st.sideToMove));
  fen.push_back(' ');
  if (st.castlingRights == 0) {
    fen.push_back('-');
  } else {
    if (st.castlingRights & bb::Castling::WK) fen.push_back('K');
    if (st.castlingRights & bb::Castling::WQ) fen.push_back('Q');
    if (st.castlingRights & bb::Castling::BK) fen.push_back('k');
    if (st.castlingRights & bb::Castling::BQ) fen.push_back('q');
  }
  fen.push_back(' ');
  fen += core::squareName(st.enPassantSquare);
  fen += ' ' + std::to_string(st.halfmoveClock) + ' ' + std::to_string(st.fullmoveNumber);
  return fen;
}

const std::vector<Move>& ChessGame::generateLegalMoves() {
  m_pseudo_moves.clear();
  m_legal_moves.clear();

  m_move_gen.generatePseudoLegalMoves(m_position.getBoard(), m_position.getState(), m_pseudo_moves);

  // Filter legality by make/unmake
  for (const auto& m : m_pseudo_moves) {
    if (m_position.doMove(m)) {
      m_position.undoMove();
      m_legal_moves.push_back(m);
    }
  }
  return m_legal_moves;
}

std::optional<Move> ChessGame::findLegalMove(std::string_view uciMove) {
  core::Square from = core::NO_SQUARE, to = core::NO_SQUARE;
  core::PieceType promo = core::PieceType::None;
  if (!parseUciCoords(normalizeUci(uciMove), from, to, promo)) return std::nullopt;
  for (const auto& m : generateLegalMoves())
    if (m.from() == from && m.to() == to && m.promotion() == promo) return m;
  return std::nullopt;
}

bool ChessGame::doMove(core::Square from, core::Square to, core::PieceType promotion) {
  for (const auto& m : generateLegalMoves()) {
    if (m.from() == from && m.to() == to && m.promotion() == promotion)
      return m_position.doMove(m);
  }
  return false;
}

bool ChessGame::doMove(const Move& m) {
  return doMove(m.from(), m.to(), m.promotion());
}

bool ChessGame::doMoveUCI(std::string_view uciMove) {
  const auto m = findLegalMove(uciMove);
  return m && m_position.doMove(*m);
}

void ChessGame::undoMove() {
  m_position.undoMove();
}

const GameState& ChessGame::getGameState() const {
  return m_position.getState();
}

bb::Piece ChessGame::getPiece(core::Square sq) const {
  return m_position.getBoard().getPiece(sq).value_or(bb::Piece{});
}

bool ChessGame::isKingInCheck(core::Color c) const {
  return m_position.isKingInCheck(c);
}

bool ChessGame::inCheck() const {
  return m_position.inCheck();
}

bool ChessGame::isCheckmate() {
  return inCheck() && generateLegalMoves().empty();
}

bool ChessGame::isStalemate() {
  return !inCheck() && generateLegalMoves().empty();
}

Position& ChessGame::getPosition() {
  return m_position;
}

const Position& ChessGame::getPosition() const {
  return m_position;
}

}  // namespace backranq::model
