#pragma once
#include <optional>
#include <string>
#include <vector>

#include "backranq/config/analysis_config.hpp"
#include "backranq/engine/evaluation.hpp"
#include "backranq/model/analysis/game_record.hpp"

namespace backranq::puzzle
{
  enum class MoveLabel
  {
    Best,
    Good,
    Inaccuracy,
    Mistake,
    Blunder,
    Unclassified
  };

  const char *toString(MoveLabel l);

  // Per-position evaluations of a game: index i is the position before ply i,
  // the last index the final position. Missing entries are allowed.
  using EvalTable = std::vector<std::optional<engine::PlyEvaluation>>;

  struct MoveQuality
  {
    int ply{0};
    std::string uci;
    std::string san;
    core::Color mover{core::Color::White};

    // Both from the mover's point of view, mate mapped to the ceiling.
    std::optional<int> evalBeforeCp;
    std::optional<int> evalAfterCp;
    // evalBefore - evalAfter; positive means the mover's position got worse.
    std::optional<int> swingCp;

    std::string bestMoveUci; // engine's top move before the ply, if known
    MoveLabel label{MoveLabel::Unclassified};

    bool classified() const { return label != MoveLabel::Unclassified; }
  };

  struct SideSummary
  {
    int classifiedMoves{0};
    int best{0}, good{0}, inaccuracies{0}, mistakes{0}, blunders{0};
    double averageLossCp{0.0};
    std::optional<double> accuracy; // absent when nothing classified
  };

  struct ClassifiedGame
  {
    std::vector<MoveQuality> moves; // one per ply
    SideSummary white;
    SideSummary black;

    const SideSummary &side(core::Color c) const { return c == core::Color::White ? white : black; }
  };

  // Side-to-move score converted to 'pov' centipawns.
  int povCp(const engine::PlyEvaluation &ev, core::Color pov, int mateCeilingCp);

  // Swing of a played move; top move or a loss within 'bestMarginCp' counts as best.
  MoveLabel labelFor(int swingCp, bool playedTopMove, const config::ResolvedConfig &cfg);

  // 103.1668 * exp(-0.04354 * avgLoss) - 3.1669, clamped to 0..100, one decimal.
  double accuracyFromAverageLoss(double averageLossCp);

  ClassifiedGame classifyMoves(const model::analysis::GameRecord &rec, const EvalTable &evals,
                               const config::ResolvedConfig &cfg);

} // namespace backranq::puzzle
