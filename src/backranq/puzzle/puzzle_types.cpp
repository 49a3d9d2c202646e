#include "backranq/puzzle/puzzle_types.hpp"

#include <algorithm>
#include <set>

#include "backranq/constants.hpp"
#include "backranq/model/chess_game.hpp"
#include "backranq/model/move.hpp"

namespace backranq::puzzle
{
  namespace
  {
    constexpr int ENDGAME_NON_PAWN_MATERIAL = 26; // pawn units, both sides
    constexpr int OPENING_PHASE_PLIES = 24;

    bool hasPrefix(const std::string &s, std::string_view pfx)
    {
      return s.size() >= pfx.size() && std::string_view(s).substr(0, pfx.size()) == pfx;
    }

    bool isLegacyMarker(const std::string &t)
    {
      return t == "avoidBlunder" || t == "punishBlunder" || hasPrefix(t, "kind:") ||
             hasPrefix(t, "eco:") || hasPrefix(t, "opening:") || hasPrefix(t, "openingVar:");
    }

    std::vector<std::string> capped(std::set<std::string> tags, const std::string &kind)
    {
      std::vector<std::string> out;
      out.reserve(std::min<std::size_t>(tags.size() + 1, core::MAX_TAGS_PER_PUZZLE));
      out.push_back(kind);
      for (const auto &t : tags)
      {
        if ((int)out.size() >= core::MAX_TAGS_PER_PUZZLE)
          break;
        out.push_back(t);
      }
      std::sort(out.begin(), out.end());
      return out;
    }
  } // namespace

  const char *toString(PuzzleType t)
  {
    return t == PuzzleType::AvoidBlunder ? "avoidBlunder" : "punishBlunder";
  }

  const char *toString(Category c)
  {
    switch (c)
    {
    case Category::Blunder:
      return "blunder";
    case Category::MissedWin:
      return "missedWin";
    case Category::MissedTactic:
      return "missedTactic";
    }
    return "blunder";
  }

  const char *toString(Severity s)
  {
    switch (s)
    {
    case Severity::Small:
      return "small";
    case Severity::Medium:
      return "medium";
    case Severity::Big:
      return "big";
    }
    return "small";
  }

  const char *toString(Motif m)
  {
    switch (m)
    {
    case Motif::Check:
      return "check";
    case Motif::Capture:
      return "capture";
    case Motif::Promotion:
      return "promotion";
    case Motif::MateThreat:
      return "mateThreat";
    case Motif::HangingPiece:
      return "hangingPiece";
    }
    return "check";
  }

  const char *toString(Phase p)
  {
    switch (p)
    {
    case Phase::Opening:
      return "opening";
    case Phase::Middlegame:
      return "middlegame";
    case Phase::Endgame:
      return "endgame";
    }
    return "middlegame";
  }

  std::optional<PuzzleType> parsePuzzleType(std::string_view s)
  {
    if (s == "avoidBlunder")
      return PuzzleType::AvoidBlunder;
    if (s == "punishBlunder")
      return PuzzleType::PunishBlunder;
    return std::nullopt;
  }

  std::optional<Category> parseCategory(std::string_view s)
  {
    for (Category c : {Category::Blunder, Category::MissedWin, Category::MissedTactic})
      if (s == toString(c))
        return c;
    return std::nullopt;
  }

  std::optional<Severity> parseSeverity(std::string_view s)
  {
    for (Severity v : {Severity::Small, Severity::Medium, Severity::Big})
      if (s == toString(v))
        return v;
    return std::nullopt;
  }

  std::optional<Motif> parseMotif(std::string_view s)
  {
    for (Motif m : {Motif::Check, Motif::Capture, Motif::Promotion, Motif::MateThreat,
                    Motif::HangingPiece})
      if (s == toString(m))
        return m;
    return std::nullopt;
  }

  std::optional<Phase> parsePhase(std::string_view s)
  {
    for (Phase p : {Phase::Opening, Phase::Middlegame, Phase::Endgame})
      if (s == toString(p))
        return p;
    return std::nullopt;
  }

  Severity severityFromSwing(int swingCp)
  {
    if (swingCp >= 400)
      return Severity::Big;
    if (swingCp >= 200)
      return Severity::Medium;
    return Severity::Small;
  }

  Phase phaseFor(const std::string &fen, int sourcePly)
  {
    model::ChessGame g;
    if (g.setPosition(fen) &&
        g.getPosition().getBoard().nonPawnMaterial() <= ENDGAME_NON_PAWN_MATERIAL)
      return Phase::Endgame;
    if (sourcePly < OPENING_PHASE_PLIES)
      return Phase::Opening;
    return Phase::Middlegame;
  }

  const char *labelFor(PuzzleType t)
  {
    return t == PuzzleType::AvoidBlunder ? "Find the best move (avoid the mistake)"
                                         : "Punish the blunder!";
  }

  std::string kindTag(PuzzleType t)
  {
    return std::string("kind:") + toString(t);
  }

  std::vector<std::string> renderTags(const std::vector<Motif> &motifs, PuzzleType t)
  {
    std::set<std::string> tags;
    for (Motif m : motifs)
      tags.insert(toString(m));
    return capped(std::move(tags), kindTag(t));
  }

  std::vector<std::string> normalizeTags(const std::vector<std::string> &in, PuzzleType t)
  {
    std::set<std::string> tags;
    for (const auto &raw : in)
    {
      if (raw.empty() || isLegacyMarker(raw))
        continue;
      tags.insert(raw);
    }
    return capped(std::move(tags), kindTag(t));
  }

  std::vector<Motif> motifsFromTags(const std::vector<std::string> &tags)
  {
    std::vector<Motif> out;
    for (const auto &t : tags)
      if (auto m = parseMotif(t))
        if (std::find(out.begin(), out.end(), *m) == out.end())
          out.push_back(*m);
    std::sort(out.begin(), out.end());
    return out;
  }

  bool Puzzle::accepts(std::string_view normalizedUci) const
  {
    if (model::normalizeUci(bestMoveUci) == normalizedUci)
      return true;
    for (const auto &m : acceptedMovesUci)
      if (model::normalizeUci(m) == normalizedUci)
        return true;
    return false;
  }

  std::string makePuzzleId(const std::string &userId, const std::string &gameId, int sourcePly,
                           PuzzleType t)
  {
    return userId + ":" + gameId + ":" + std::to_string(sourcePly) + ":" + toString(t);
  }

} // namespace backranq::puzzle
