#include "backranq/model/analysis/san_notation.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "backranq/model/chess_game.hpp"

namespace backranq::model::notation
{
  namespace
  {
    inline char pieceLetter(core::PieceType pt)
    {
      switch (pt)
      {
      case core::PieceType::Knight:
        return 'N';
      case core::PieceType::Bishop:
        return 'B';
      case core::PieceType::Rook:
        return 'R';
      case core::PieceType::Queen:
        return 'Q';
      case core::PieceType::King:
        return 'K';
      default:
        return '\0'; // pawn/none
      }
    }

    inline std::string trim(std::string_view v)
    {
      std::size_t a = 0, b = v.size();
      while (a < b && std::isspace((unsigned char)v[a]))
        ++a;
      while (b > a && std::isspace((unsigned char)v[b - 1]))
        --b;
      return std::string(v.substr(a, b - a));
    }

    inline model::ChessGame gameFromPosition(const model::Position &pos)
    {
      model::ChessGame g;
      g.getPosition() = pos;
      return g;
    }

    inline bool isUciLike(std::string_view t)
    {
      core::Square from, to;
      core::PieceType promo;
      return model::parseUciCoords(t, from, to, promo);
    }

    // "+" or "#" when the move gives check or mate.
    std::string checkSuffix(const model::Position &pos, const model::Move &mv)
    {
      model::ChessGame after = gameFromPosition(pos);
      if (!after.doMove(mv) || !after.inCheck())
        return "";
      return after.generateLegalMoves().empty() ? "#" : "+";
    }
  } // namespace

  std::string normalizeSan(std::string_view in)
  {
    std::string s = trim(in);

    // strip trailing annotations and check symbols
    while (!s.empty())
    {
      char c = s.back();
      if (c == '+' || c == '#' || c == '!' || c == '?')
        s.pop_back();
      else
        break;
    }
    if (s == "0-0")
      s = "O-O";
    if (s == "0-0-0")
      s = "O-O-O";
    return s;
  }

  std::string toSan(const model::Position &pos, const model::Move &mv)
  {
    model::ChessGame g = gameFromPosition(pos);
    const auto &legals = g.generateLegalMoves();

    const model::Move *match = nullptr;
    for (const auto &m : legals)
      if (m == mv)
      {
        match = &m;
        break;
      }
    if (!match)
      return "";
    const model::Move m = *match;

    if (m.castle() != model::CastleSide::None)
    {
      std::string san = (m.castle() == model::CastleSide::KingSide) ? "O-O" : "O-O-O";
      return san + checkSuffix(pos, m);
    }

    const auto mover = g.getPiece(m.from());
    const core::PieceType pt = mover.type;
    const bool isPawn = (pt == core::PieceType::Pawn);

    std::string san;

    // Piece letter plus disambiguation for non-pawns
    if (!isPawn)
    {
      san.push_back(pieceLetter(pt));

      const int fromFile = core::file_of(m.from());
      const int fromRank = core::rank_of(m.from());

      bool competitors = false;
      bool anySameFile = false;
      bool anySameRank = false;
      for (const auto &o : legals)
      {
        if (o.to() != m.to() || o.from() == m.from())
          continue;
        const auto pc = g.getPiece(o.from());
        if (pc.type != pt || pc.color != mover.color)
          continue;
        competitors = true;
        if (core::file_of(o.from()) == fromFile)
          anySameFile = true;
        if (core::rank_of(o.from()) == fromRank)
          anySameRank = true;
      }

      if (competitors)
      {
        if (!anySameFile)
          san.push_back(char('a' + fromFile));
        else if (!anySameRank)
          san.push_back(char('1' + fromRank));
        else
        {
          san.push_back(char('a' + fromFile));
          san.push_back(char('1' + fromRank));
        }
      }
    }

    // Capture marker (pawn captures include origin file)
    if (m.isCapture())
    {
      if (isPawn)
        san.push_back(char('a' + core::file_of(m.from())));
      san.push_back('x');
    }

    san += core::squareName(m.to());

    if (m.promotion() != core::PieceType::None)
    {
      san.push_back('=');
      san.push_back(pieceLetter(m.promotion()));
    }

    return san + checkSuffix(pos, m);
  }

  bool fromSan(const model::Position &pos, std::string_view sanToken, model::Move &out)
  {
    std::string tok = normalizeSan(sanToken);
    if (tok.empty())
      return false;

    if (tok == "1-0" || tok == "0-1" || tok == "1/2-1/2" || tok == "*")
      return false;

    model::ChessGame g = gameFromPosition(pos);

    // UCI-like fallback
    if (isUciLike(tok))
    {
      if (auto m = g.findLegalMove(tok))
      {
        out = *m;
        return true;
      }
      return false;
    }

    // Promotions are sometimes written without '=' ("e8Q").
    if (tok.size() >= 3 && std::isupper((unsigned char)tok.back()) &&
        std::isdigit((unsigned char)tok[tok.size() - 2]))
      tok.insert(tok.size() - 1, "=");

    // Robust SAN matching by generation
    const std::vector<model::Move> legals = g.generateLegalMoves();
    for (const auto &m : legals)
    {
      if (normalizeSan(toSan(pos, m)) == tok)
      {
        out = m;
        return true;
      }
    }
    return false;
  }

} // namespace backranq::model::notation
