#include "backranq/model/analysis/pgn_reader.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "backranq/model/chess_game.hpp"
#include "backranq/model/analysis/san_notation.hpp"

namespace backranq::model::analysis
{
  namespace
  {
    enum class TokenKind
    {
      MoveNumber, // "12." "12..." "..."
      Result,
      San
    };

    struct MoveToken
    {
      TokenKind kind;
      std::string text;
    };

    bool isGameResult(std::string_view w)
    {
      return w == "1-0" || w == "0-1" || w == "1/2-1/2" || w == "*";
    }

    // "12.Nf3" and "3...Bc5" carry a move number and a move in one word.
    void classifyWord(std::string_view w, std::vector<MoveToken> &out)
    {
      if (isGameResult(w))
      {
        out.push_back({TokenKind::Result, std::string(w)});
        return;
      }

      const std::size_t numEnd = w.find_first_not_of("0123456789");
      if (numEnd == std::string_view::npos || w[numEnd] != '.')
      {
        out.push_back({TokenKind::San, std::string(w)});
        return;
      }

      const std::size_t moveStart = w.find_first_not_of('.', numEnd);
      out.push_back({TokenKind::MoveNumber, std::string(w.substr(0, moveStart))});
      if (moveStart != std::string_view::npos)
        out.push_back({TokenKind::San, std::string(w.substr(moveStart))});
    }

    // Main line tokens only: {comments}, ; comments, (nested variations) and $NAGs are dropped.
    std::vector<MoveToken> scanMovetext(std::string_view text)
    {
      std::vector<MoveToken> out;
      std::string word;
      int variationDepth = 0;

      auto endWord = [&]
      {
        if (!word.empty())
          classifyWord(word, out);
        word.clear();
      };

      for (std::size_t i = 0; i < text.size(); ++i)
      {
        const char c = text[i];
        if (c == '{' || c == ';')
        {
          endWord();
          const std::size_t close = c == '{' ? text.find('}', i) : text.find_first_of("\r\n", i);
          if (close == std::string_view::npos)
            break;
          i = close;
          continue;
        }
        if (c == '(' || c == ')')
        {
          endWord();
          variationDepth += c == '(' ? 1 : (variationDepth > 0 ? -1 : 0);
          continue;
        }
        if (variationDepth > 0)
          continue;

        if (c == '$')
        {
          endWord();
          while (i + 1 < text.size() && std::isdigit((unsigned char)text[i + 1]))
            ++i;
          continue;
        }
        if (std::isspace((unsigned char)c))
        {
          endWord();
          continue;
        }
        word.push_back(c);
      }
      endWord();
      return out;
    }

    // Reads [Key "Value"] pairs at the top and returns the offset where movetext starts.
    std::size_t parseTags(std::string_view pgn, GameRecord &out)
    {
      std::size_t i = 0;
      while (i < pgn.size())
      {
        while (i < pgn.size() && std::isspace((unsigned char)pgn[i]))
          ++i;
        if (i >= pgn.size() || pgn[i] != '[')
          break;

        const std::size_t end = pgn.find(']', i);
        if (end == std::string_view::npos)
          break;

        const std::string_view line = pgn.substr(i + 1, end - i - 1);
        const std::size_t sp = line.find(' ');
        if (sp != std::string_view::npos)
        {
          std::string key(line.substr(0, sp));
          std::string_view rest = line.substr(sp + 1);

          const std::size_t q1 = rest.find('"');
          const std::size_t q2 = rest.rfind('"');
          if (q1 != std::string_view::npos && q2 != std::string_view::npos && q2 > q1)
            out.tags[key] = std::string(rest.substr(q1 + 1, q2 - q1 - 1));
        }

        i = end + 1;
      }
      return i;
    }
  } // namespace

  bool parsePgnToRecord(std::string_view pgn, GameRecord &out, std::string *err)
  {
    out = GameRecord{};
    const std::size_t movetextStart = parseTags(pgn, out);

    out.startFen = out.tag("FEN").value_or(core::START_FEN);

    model::ChessGame g;
    std::string fenErr;
    if (!g.setPosition(out.startFen, &fenErr))
    {
      if (err)
        *err = "Invalid FEN tag: " + fenErr;
      return false;
    }
    out.startFen = g.getFen();

    for (const MoveToken &t : scanMovetext(pgn.substr(movetextStart)))
    {
      if (t.kind == TokenKind::MoveNumber)
        continue;
      if (t.kind == TokenKind::Result)
      {
        out.result = t.text;
        break;
      }

      model::Move mv;
      const model::Position &pos = g.getPosition();

      if (!model::notation::fromSan(pos, t.text, mv))
      {
        if (err)
          *err = "Could not parse SAN token: " + t.text;
        return false;
      }

      PlyRecord pr{};
      pr.move = mv;
      pr.san = model::notation::toSan(pos, mv);
      pr.uci = model::toUci(mv);
      pr.fenBefore = g.getFen();
      pr.mover = g.getGameState().sideToMove;

      // Apply to validate legality and advance.
      if (!g.doMove(mv))
      {
        if (err)
          *err = "Illegal move in PGN: " + t.text;
        return false;
      }
      out.plies.push_back(std::move(pr));
    }

    out.finalFen = g.getFen();
    if (out.result.empty())
      out.result = "*";
    if (auto r = out.tag("Result"); r && out.result == "*")
      out.result = *r;

    return true;
  }
}
