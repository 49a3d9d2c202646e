#include "backranq/puzzle/puzzle_extractor.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <optional>

#include "backranq/constants.hpp"
#include "backranq/engine/thread_pool.hpp"
#include "backranq/model/chess_game.hpp"
#include "backranq/model/move.hpp"

namespace backranq::puzzle
{
  constexpr int MATE_THREAT_MAX_MOVES = 5;
  constexpr int HANGING_PIECE_LOSS = 3; // pawn units
  constexpr int HANGING_PIECE_PLIES = 4;

  enum class PuzzleExtractor::Reject
  {
    None,
    Band,
    Swing,
    Uniqueness,
    Tactical,
    Trivial,
    Line
  };

  struct PuzzleExtractor::Candidate
  {
    PuzzleType type{PuzzleType::AvoidBlunder};
    int ply{0};      // index of the played move the puzzle is about
    int startIdx{0}; // position the puzzle starts from
    core::Color mover{core::Color::White};
    core::Color solver{core::Color::White};
    std::string fen;
    std::vector<engine::EvalLine> lines;
    engine::Score score;
    int startEvalCp{0};
    int swingCp{0};
  };

  LineSignals scanLine(const std::string &fen, const std::vector<std::string> &pvUci, int maxPlies)
  {
    LineSignals sig;
    model::ChessGame g;
    if (!g.setPosition(fen))
      return sig;

    const int n = std::min<int>(maxPlies, (int)pvUci.size());
    for (int i = 0; i < n; ++i)
    {
      auto mv = g.findLegalMove(model::normalizeUci(pvUci[i]));
      if (!mv || !g.doMove(*mv))
        break;
      ++sig.applied;
      sig.capture = sig.capture || mv->isCapture();
      sig.promotion = sig.promotion || mv->promotion() != core::PieceType::None;
      sig.check = sig.check || g.inCheck();
    }
    return sig;
  }

  int materialLoss(const std::string &fen, const std::vector<std::string> &pvUci, core::Color side,
                   int maxPlies)
  {
    model::ChessGame g;
    if (!g.setPosition(fen))
      return 0;
    const int base = g.getPosition().getBoard().material(side);

    const int n = std::min<int>(maxPlies, (int)pvUci.size());
    int applied = 0;
    for (int i = 0; i < n; ++i)
    {
      if (!g.doMoveUCI(model::normalizeUci(pvUci[i])))
        break;
      ++applied;
    }
    if (applied == 0)
      return 0;
    return base - g.getPosition().getBoard().material(side);
  }

  PuzzleExtractor::PuzzleExtractor(config::ResolvedConfig cfg, engine::EvaluationAdapter *confirmer,
                                   std::chrono::milliseconds grace)
      : m_cfg(std::move(cfg)), m_confirmer(confirmer), m_grace(grace)
  {
  }

  bool PuzzleExtractor::isMistake(const MoveQuality &mq) const
  {
    if (mq.label == MoveLabel::Best || mq.label == MoveLabel::Good)
      return false;
    if (!mq.bestMoveUci.empty() && model::normalizeUci(mq.uci) == model::normalizeUci(mq.bestMoveUci))
      return false;
    return mq.swingCp && *mq.swingCp >= m_cfg.missedTacticSwingCp;
  }

  Category PuzzleExtractor::categorize(int startEvalCp, int swingCp) const
  {
    if (swingCp >= m_cfg.blunderSwingCp)
      return Category::Blunder;
    if (startEvalCp >= m_cfg.winningThresholdCp && swingCp >= m_cfg.missedWinSwingCp)
      return Category::MissedWin;
    return Category::MissedTactic;
  }

  PuzzleExtractor::Reject PuzzleExtractor::checkEvaluation(int startEvalCp, int swingCp,
                                                           const std::vector<engine::EvalLine> &lines,
                                                           const std::string &fen) const
  {
    if (m_cfg.evalBandMinCp && startEvalCp < *m_cfg.evalBandMinCp)
      return Reject::Band;
    if (m_cfg.evalBandMaxCp && startEvalCp > *m_cfg.evalBandMaxCp)
      return Reject::Band;

    if (swingCp < m_cfg.missedTacticSwingCp)
      return Reject::Swing;

    if (m_cfg.uniquenessMarginCp)
    {
      if (lines.size() < 2)
        return Reject::Uniqueness;
      const int top = lines[0].score.toCp(m_cfg.mateCeilingCp);
      const int second = lines[1].score.toCp(m_cfg.mateCeilingCp);
      if (top - second < *m_cfg.uniquenessMarginCp)
        return Reject::Uniqueness;
    }

    if (m_cfg.requireTactical)
    {
      if (lines.empty() ||
          !scanLine(fen, lines.front().pvUci, m_cfg.tacticalLookaheadPlies).tactical())
        return Reject::Tactical;
    }
    return Reject::None;
  }

  bool PuzzleExtractor::confirm(Candidate &c, const AnalyzedGame &game, std::string &why) const
  {
    engine::EvalRequest req;
    req.fen = c.fen;
    req.multiPv = m_cfg.multiPv;
    req.maxTimeMs = *m_cfg.confirmMovetimeMs;
    // Deeper than the scan, or it confirms nothing.
    const auto &scanned = game.evals[c.startIdx];
    if (scanned && scanned->depth > 0)
      req.minDepth = scanned->depth + 1;

    std::optional<engine::EvalSnapshot> snap;
    try
    {
      snap = engine::evaluateWithBudget(*m_confirmer, req, m_grace, &why);
    }
    catch (const std::exception &e)
    {
      why = e.what();
      return false;
    }
    if (!snap)
      return false;

    const engine::EvalLine &deep = snap->lines.front();
    const std::string original = c.lines.empty() ? std::string{} : model::normalizeUci(c.lines.front().moveUci);
    if (model::normalizeUci(deep.moveUci) != original)
    {
      why = "best move changed to " + deep.moveUci;
      return false;
    }

    const MoveQuality &mq = game.classified.moves[c.ply];
    const int deepStart = deep.score.toCp(m_cfg.mateCeilingCp);
    // Avoid: deeper view of the position before the move against the same position after it.
    // Punish: the same position before the move against a deeper view after it.
    const int swing = c.type == PuzzleType::AvoidBlunder ? deepStart - *mq.evalAfterCp
                                                         : *mq.evalBeforeCp + deepStart;

    switch (checkEvaluation(deepStart, swing, snap->lines, c.fen))
    {
    case Reject::None:
      break;
    case Reject::Band:
      why = "eval " + std::to_string(deepStart) + " outside band";
      return false;
    case Reject::Swing:
      why = "swing shrank to " + std::to_string(swing);
      return false;
    case Reject::Uniqueness:
      why = "best move no longer unique";
      return false;
    default:
      why = "line no longer tactical";
      return false;
    }

    c.lines = std::move(snap->lines);
    c.score = deep.score;
    c.startEvalCp = deepStart;
    c.swingCp = swing;
    return true;
  }

  Puzzle PuzzleExtractor::build(const Candidate &c, const AnalyzedGame &game,
                                const model::analysis::OpeningInfo &opening) const
  {
    Puzzle p;
    p.sourcePly = c.startIdx;
    p.fen = c.fen;
    p.sideToMove = c.solver;
    p.type = c.type;
    p.category = categorize(c.startEvalCp, c.swingCp);
    p.phase = phaseFor(c.fen, c.startIdx);
    p.severity = severityFromSwing(c.swingCp);
    p.score = c.score;
    p.swingCp = c.swingCp;

    const engine::EvalLine &top = c.lines.front();
    p.bestMoveUci = model::normalizeUci(top.moveUci);
    for (const auto &m : top.pvUci)
      p.bestLineUci.push_back(model::normalizeUci(m));

    // Other engine lines as good as the top one are accepted too.
    const int topCp = top.score.toCp(m_cfg.mateCeilingCp);
    p.acceptedMovesUci.push_back(p.bestMoveUci);
    for (std::size_t k = 1; k < c.lines.size(); ++k)
    {
      if ((int)p.acceptedMovesUci.size() >= core::MAX_ACCEPTED_MOVES)
        break;
      const std::string mv = model::normalizeUci(c.lines[k].moveUci);
      if (topCp - c.lines[k].score.toCp(m_cfg.mateCeilingCp) <= m_cfg.bestMarginCp &&
          std::find(p.acceptedMovesUci.begin(), p.acceptedMovesUci.end(), mv) ==
              p.acceptedMovesUci.end())
        p.acceptedMovesUci.push_back(mv);
    }

    const LineSignals sig = scanLine(c.fen, top.pvUci, m_cfg.tacticalLookaheadPlies);
    if (sig.check)
      p.motifs.push_back(Motif::Check);
    if (sig.capture)
      p.motifs.push_back(Motif::Capture);
    if (sig.promotion)
      p.motifs.push_back(Motif::Promotion);
    if (c.score.isMate() && c.score.value > 0 && c.score.value <= MATE_THREAT_MAX_MOVES)
      p.motifs.push_back(Motif::MateThreat);

    // The refutation is the engine line in the position right after the mistake.
    const std::vector<std::string> *refutation = nullptr;
    if (c.type == PuzzleType::PunishBlunder)
      refutation = &top.pvUci;
    else if (const auto &after = game.evals[c.ply + 1]; after && after->best())
      refutation = &after->best()->pvUci;
    if (refutation &&
        materialLoss(game.record.fenAt(c.ply + 1), *refutation, c.mover, HANGING_PIECE_PLIES) >=
            HANGING_PIECE_LOSS)
      p.motifs.push_back(Motif::HangingPiece);

    p.tags = renderTags(p.motifs, p.type);
    p.opening = opening;
    p.label = labelFor(p.type);
    return p;
  }

  ExtractionResult PuzzleExtractor::extract(const ExtractionInput &in) const
  {
    ExtractionResult result;
    ExtractionStats &st = result.stats;
    if (!in.game)
      return result;
    const AnalyzedGame &game = *in.game;
    const auto &rec = game.record;

    const bool wantAvoid = m_cfg.puzzleMode != config::PuzzleMode::PunishBlunder;
    const bool wantPunish = m_cfg.puzzleMode != config::PuzzleMode::AvoidBlunder;

    std::vector<Candidate> candidates;
    int cooldownUntil = -1; // plies <= this are skipped

    const int n = (int)std::min(rec.plies.size(), game.classified.moves.size());
    for (int i = std::max(0, m_cfg.openingSkipPlies); i < n; ++i)
    {
      const MoveQuality &mq = game.classified.moves[i];
      if (!mq.classified())
        continue;
      ++st.scannedPlies;
      if (!isMistake(mq))
        continue;
      if (i <= cooldownUntil)
      {
        ++st.skippedCooldown;
        continue;
      }
      ++st.mistakes;

      bool produced = false;
      for (PuzzleType type : {PuzzleType::AvoidBlunder, PuzzleType::PunishBlunder})
      {
        if (type == PuzzleType::AvoidBlunder && !wantAvoid)
          continue;
        if (type == PuzzleType::PunishBlunder && !wantPunish)
          continue;

        Candidate c;
        c.type = type;
        c.ply = i;
        c.mover = mq.mover;
        c.solver = type == PuzzleType::AvoidBlunder ? mq.mover : ~mq.mover;
        c.startIdx = type == PuzzleType::AvoidBlunder ? i : i + 1;
        if (m_cfg.userColor && *m_cfg.userColor != c.solver)
          continue;
        ++st.framings;

        const auto &ev = game.evals[c.startIdx];
        c.fen = rec.fenAt(c.startIdx);
        c.lines = ev->lines;
        c.score = ev->score;
        c.startEvalCp = ev->score.toCp(m_cfg.mateCeilingCp);
        c.swingCp = *mq.swingCp;

        if (type == PuzzleType::PunishBlunder && m_cfg.skipPunishedBlunders &&
            i + 1 < (int)rec.plies.size() && !ev->bestMoveUci().empty() &&
            model::normalizeUci(rec.plies[i + 1].uci) == model::normalizeUci(ev->bestMoveUci()))
        {
          ++st.rejectedPunished;
          continue;
        }

        switch (checkEvaluation(c.startEvalCp, c.swingCp, c.lines, c.fen))
        {
        case Reject::None:
          break;
        case Reject::Band:
          ++st.rejectedBand;
          continue;
        case Reject::Swing:
          ++st.rejectedSwing;
          continue;
        case Reject::Uniqueness:
          ++st.rejectedUniqueness;
          continue;
        default:
          ++st.rejectedTactical;
          continue;
        }

        if (m_cfg.skipTrivialEndgames)
        {
          model::ChessGame g;
          if (!g.setPosition(c.fen) ||
              g.getPosition().getBoard().nonKingPieceCount() < m_cfg.minNonKingPieces)
          {
            ++st.rejectedTrivial;
            continue;
          }
        }

        if (c.lines.empty() || (int)c.lines.front().pvUci.size() < m_cfg.minPvMoves ||
            c.lines.front().moveUci.empty())
        {
          ++st.rejectedLine;
          continue;
        }

        candidates.push_back(std::move(c));
        produced = true;
      }

      if (produced && m_cfg.cooldownPliesAfterPuzzle > 0)
        cooldownUntil = i + m_cfg.cooldownPliesAfterPuzzle;
    }
    st.candidates = (int)candidates.size();

    std::vector<char> keep(candidates.size(), 1);
    if (m_confirmer && m_cfg.confirmationEnabled() && !candidates.empty())
    {
      const int workers = std::min<int>(m_cfg.confirmWorkers, (int)candidates.size());
      std::vector<std::string> reasons(candidates.size());
      {
        engine::ThreadPool pool(workers);
        std::vector<std::future<bool>> futs;
        futs.reserve(candidates.size());
        for (std::size_t k = 0; k < candidates.size(); ++k)
          futs.push_back(pool.submit([this, &candidates, &game, &reasons, k]
                                     { return confirm(candidates[k], game, reasons[k]); }));
        for (std::size_t k = 0; k < futs.size(); ++k)
          keep[k] = futs[k].get() ? 1 : 0;
      }

      for (std::size_t k = 0; k < candidates.size(); ++k)
      {
        if (keep[k])
        {
          ++st.confirmed;
          continue;
        }
        ++st.droppedByConfirmation;
        std::cerr << "[PuzzleExtractor] dropped " << toString(candidates[k].type) << " at ply "
                  << candidates[k].startIdx << " after confirmation: "
                  << (reasons[k].empty() ? "no result" : reasons[k]) << "\n";
      }
    }

    for (std::size_t k = 0; k < candidates.size(); ++k)
      if (keep[k])
        result.puzzles.push_back(build(candidates[k], game, in.opening));

    std::stable_sort(result.puzzles.begin(), result.puzzles.end(),
                     [](const Puzzle &a, const Puzzle &b)
                     {
                       if (*a.severity != *b.severity)
                         return *a.severity > *b.severity;
                       if (a.sourcePly != b.sourcePly)
                         return a.sourcePly < b.sourcePly;
                       return a.type < b.type;
                     });

    if (m_cfg.maxPuzzlesPerGame > 0 && (int)result.puzzles.size() > m_cfg.maxPuzzlesPerGame)
    {
      st.truncated = (int)result.puzzles.size() - m_cfg.maxPuzzlesPerGame;
      result.puzzles.resize(m_cfg.maxPuzzlesPerGame);
    }

    if (!in.userId.empty() && !in.gameId.empty())
    {
      for (auto &p : result.puzzles)
      {
        p.userId = in.userId;
        p.gameId = in.gameId;
        p.id = makePuzzleId(in.userId, in.gameId, p.sourcePly, p.type);
      }
    }
    return result;
  }

} // namespace backranq::puzzle
