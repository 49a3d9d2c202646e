#include "backranq/puzzle/move_classifier.hpp"

#include <algorithm>
#include <cmath>

#include "backranq/model/move.hpp"

namespace backranq::puzzle
{
  const char *toString(MoveLabel l)
  {
    switch (l)
    {
    case MoveLabel::Best:
      return "best";
    case MoveLabel::Good:
      return "good";
    case MoveLabel::Inaccuracy:
      return "inaccuracy";
    case MoveLabel::Mistake:
      return "mistake";
    case MoveLabel::Blunder:
      return "blunder";
    case MoveLabel::Unclassified:
      return "unclassified";
    }
    return "unclassified";
  }

  int povCp(const engine::PlyEvaluation &ev, core::Color pov, int mateCeilingCp)
  {
    const int stm = ev.score.toCp(mateCeilingCp);
    return ev.sideToMove == pov ? stm : -stm;
  }

  MoveLabel labelFor(int swingCp, bool playedTopMove, const config::ResolvedConfig &cfg)
  {
    if (playedTopMove || swingCp <= cfg.bestMarginCp)
      return MoveLabel::Best;
    if (swingCp < cfg.inaccuracyCp)
      return MoveLabel::Good;
    if (swingCp < cfg.missedTacticSwingCp)
      return MoveLabel::Inaccuracy;
    if (swingCp < cfg.blunderSwingCp)
      return MoveLabel::Mistake;
    return MoveLabel::Blunder;
  }

  double accuracyFromAverageLoss(double averageLossCp)
  {
    const double raw = 103.1668 * std::exp(-0.04354 * averageLossCp) - 3.1669;
    const double clamped = std::clamp(raw, 0.0, 100.0);
    return std::round(clamped * 10.0) / 10.0;
  }

  static void tally(SideSummary &s, const MoveQuality &q)
  {
    switch (q.label)
    {
    case MoveLabel::Best:
      ++s.best;
      break;
    case MoveLabel::Good:
      ++s.good;
      break;
    case MoveLabel::Inaccuracy:
      ++s.inaccuracies;
      break;
    case MoveLabel::Mistake:
      ++s.mistakes;
      break;
    case MoveLabel::Blunder:
      ++s.blunders;
      break;
    case MoveLabel::Unclassified:
      return;
    }
    ++s.classifiedMoves;
    s.averageLossCp += std::max(0, *q.swingCp); // summed here, divided in finish()
  }

  static void finish(SideSummary &s)
  {
    if (s.classifiedMoves == 0)
      return;
    s.averageLossCp /= s.classifiedMoves;
    s.accuracy = accuracyFromAverageLoss(s.averageLossCp);
  }

  ClassifiedGame classifyMoves(const model::analysis::GameRecord &rec, const EvalTable &evals,
                               const config::ResolvedConfig &cfg)
  {
    ClassifiedGame out;
    out.moves.reserve(rec.plies.size());

    for (std::size_t i = 0; i < rec.plies.size(); ++i)
    {
      const auto &ply = rec.plies[i];
      MoveQuality q;
      q.ply = (int)i;
      q.uci = ply.uci;
      q.san = ply.san;
      q.mover = ply.mover;

      const engine::PlyEvaluation *before = (i < evals.size() && evals[i]) ? &*evals[i] : nullptr;
      const engine::PlyEvaluation *after =
          (i + 1 < evals.size() && evals[i + 1]) ? &*evals[i + 1] : nullptr;

      if (before)
      {
        q.bestMoveUci = before->bestMoveUci();
        q.evalBeforeCp = povCp(*before, ply.mover, cfg.mateCeilingCp);
      }
      if (after)
        q.evalAfterCp = povCp(*after, ply.mover, cfg.mateCeilingCp);

      if (q.evalBeforeCp && q.evalAfterCp)
      {
        q.swingCp = *q.evalBeforeCp - *q.evalAfterCp;
        const bool top = !q.bestMoveUci.empty() &&
                         model::normalizeUci(q.bestMoveUci) == model::normalizeUci(ply.uci);
        q.label = labelFor(*q.swingCp, top, cfg);
        tally(ply.mover == core::Color::White ? out.white : out.black, q);
      }

      out.moves.push_back(std::move(q));
    }

    finish(out.white);
    finish(out.black);
    return out;
  }

} // namespace backranq::puzzle
