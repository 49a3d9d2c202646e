#include "backranq/puzzle/puzzle_record.hpp"

#include <algorithm>
#include <climits>

#include "backranq/constants.hpp"
#include "backranq/model/chess_game.hpp"
#include "backranq/model/move.hpp"

namespace backranq::puzzle
{
  PuzzleRecord toRecord(const Puzzle &p)
  {
    PuzzleRecord r;
    r.sourcePly = p.sourcePly;
    r.fen = p.fen;
    r.bestMoveUci = p.bestMoveUci;
    r.bestLineUci = p.bestLineUci;
    r.tags = p.tags;
    r.acceptedMovesUci = p.acceptedMovesUci;
    r.type = toString(p.type);
    r.category = toString(p.category);
    if (p.severity)
      r.severity = toString(*p.severity);
    r.score = p.score;
    r.swingCp = p.swingCp;
    r.label = p.label;
    r.openingEco = p.opening.eco;
    r.openingName = p.opening.name;
    r.openingVariation = p.opening.variation;
    r.openingSource = model::analysis::toString(p.opening.source);
    return r;
  }

  static bool contains(const std::vector<std::string> &v, const std::string &s)
  {
    return std::find(v.begin(), v.end(), s) != v.end();
  }

  std::optional<Puzzle> ingestRecord(const PuzzleRecord &rec, const std::string &userId,
                                     const std::string &gameId, std::string *why)
  {
    auto reject = [&](const char *msg) -> std::optional<Puzzle>
    {
      if (why)
        *why = msg;
      return std::nullopt;
    };

    if (!rec.sourcePly || *rec.sourcePly < 0 || *rec.sourcePly > INT_MAX)
      return reject("sourcePly must be a non-negative integer");
    if (!rec.fen || rec.fen->empty())
      return reject("missing fen");
    if (!rec.bestMoveUci)
      return reject("missing best move");
    if (!rec.bestLineUci)
      return reject("missing best line");
    if (!rec.tags)
      return reject("missing tags");

    Puzzle p;
    p.userId = userId;
    p.gameId = gameId;
    p.sourcePly = (int)*rec.sourcePly;
    p.fen = *rec.fen;

    model::ChessGame g;
    if (!g.setPosition(p.fen))
      return reject("invalid fen");
    p.sideToMove = g.getGameState().sideToMove;

    p.bestMoveUci = model::normalizeUci(*rec.bestMoveUci);
    if (p.bestMoveUci.empty())
      return reject("empty best move");

    for (const auto &m : *rec.bestLineUci)
    {
      std::string n = model::normalizeUci(m);
      if (!n.empty())
        p.bestLineUci.push_back(std::move(n));
    }

    const auto &tags = *rec.tags;
    if (rec.type && parsePuzzleType(*rec.type))
      p.type = *parsePuzzleType(*rec.type);
    else if (contains(tags, "punishBlunder") || contains(tags, kindTag(PuzzleType::PunishBlunder)))
      p.type = PuzzleType::PunishBlunder;
    else
      p.type = PuzzleType::AvoidBlunder;

    std::optional<Category> category = rec.category ? parseCategory(*rec.category) : std::nullopt;
    for (const auto &t : tags)
    {
      if (category)
        break;
      if (t.rfind("kind:", 0) == 0)
        category = parseCategory(t.substr(5));
    }
    p.category = category.value_or(Category::Blunder);

    p.tags = normalizeTags(tags, p.type);
    p.motifs = motifsFromTags(p.tags);

    p.acceptedMovesUci.push_back(p.bestMoveUci);
    if (rec.acceptedMovesUci)
    {
      for (const auto &m : *rec.acceptedMovesUci)
      {
        if ((int)p.acceptedMovesUci.size() >= core::MAX_ACCEPTED_MOVES)
          break;
        std::string n = model::normalizeUci(m);
        if (!n.empty() && !contains(p.acceptedMovesUci, n))
          p.acceptedMovesUci.push_back(std::move(n));
      }
    }

    if (rec.severity)
      p.severity = parseSeverity(*rec.severity);
    p.score = rec.score;
    p.swingCp = rec.swingCp.value_or(0);
    p.phase = phaseFor(p.fen, p.sourcePly);
    p.label = rec.label.value_or(labelFor(p.type));

    auto nonEmpty = [](const std::optional<std::string> &s)
    { return (s && !s->empty()) ? s : std::nullopt; };
    p.opening.eco = nonEmpty(rec.openingEco);
    p.opening.name = nonEmpty(rec.openingName);
    p.opening.variation = nonEmpty(rec.openingVariation);
    using model::analysis::OpeningSource;
    if (!p.opening.eco && !p.opening.name && !p.opening.variation)
      p.opening.source = OpeningSource::Unknown;
    else if (rec.openingSource && *rec.openingSource == "guess")
      p.opening.source = OpeningSource::Guess;
    else
      p.opening.source = OpeningSource::Pgn;

    p.id = makePuzzleId(userId, gameId, p.sourcePly, p.type);
    return p;
  }

} // namespace backranq::puzzle
