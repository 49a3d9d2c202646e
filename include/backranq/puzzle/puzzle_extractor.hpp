#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "backranq/config/analysis_config.hpp"
#include "backranq/engine/evaluation_adapter.hpp"
#include "backranq/model/analysis/opening_classifier.hpp"
#include "backranq/puzzle/game_analyzer.hpp"
#include "backranq/puzzle/puzzle_types.hpp"

namespace backranq::puzzle
{
  struct ExtractionInput
  {
    const AnalyzedGame *game{nullptr};
    model::analysis::OpeningInfo opening;
    std::string userId; // optional; ids are assigned when both are set
    std::string gameId;
  };

  // Why candidates fell out, for diagnostics.
  struct ExtractionStats
  {
    int scannedPlies{0}; // classified plies looked at
    int mistakes{0};     // plies whose move lost enough to frame a puzzle
    int framings{0};
    int rejectedPunished{0};
    int rejectedBand{0};
    int rejectedSwing{0};
    int rejectedUniqueness{0};
    int rejectedTactical{0};
    int rejectedTrivial{0};
    int rejectedLine{0};
    int skippedCooldown{0};
    int candidates{0};
    int confirmed{0};
    int droppedByConfirmation{0};
    int truncated{0};
  };

  struct ExtractionResult
  {
    std::vector<Puzzle> puzzles;
    ExtractionStats stats;
  };

  // Turns a classified, evaluated game into puzzles.
  //
  // Each mistake past openingSkipPlies is framed as avoidBlunder (the position before
  // the move, posed to the mover) and/or punishBlunder (the position after it, posed to the
  // opponent), then filtered by eval band, swing, uniqueness, tactical content, material and
  // line length. With a confirmer and confirmMovetimeMs above movetimeMs every survivor is
  // re-evaluated at the longer budget on a worker pool and must hold up.
  class PuzzleExtractor
  {
  public:
    explicit PuzzleExtractor(config::ResolvedConfig cfg,
                             engine::EvaluationAdapter *confirmer = nullptr,
                             std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    ExtractionResult extract(const ExtractionInput &in) const;

    const config::ResolvedConfig &config() const { return m_cfg; }

  private:
    struct Candidate;
    enum class Reject;

    // Played move is neither the engine's choice nor within the good band, and lost at
    // least missedTacticSwingCp.
    bool isMistake(const MoveQuality &mq) const;

    // Filters that apply to any evaluation of a start position: band, swing, uniqueness, tactics.
    Reject checkEvaluation(int startEvalCp, int swingCp, const std::vector<engine::EvalLine> &lines,
                           const std::string &fen) const;
    Category categorize(int startEvalCp, int swingCp) const;

    // Re-evaluates at the confirmation budget; on success the candidate carries the deeper lines.
    bool confirm(Candidate &c, const AnalyzedGame &game, std::string &why) const;
    Puzzle build(const Candidate &c, const AnalyzedGame &game,
                 const model::analysis::OpeningInfo &opening) const;

    config::ResolvedConfig m_cfg;
    engine::EvaluationAdapter *m_confirmer;
    std::chrono::milliseconds m_grace;
  };

  // Capture/check/promotion seen while replaying up to 'maxPlies' of a line.
  struct LineSignals
  {
    bool check{false};
    bool capture{false};
    bool promotion{false};
    int applied{0};

    bool tactical() const { return check || capture || promotion; }
  };

  LineSignals scanLine(const std::string &fen, const std::vector<std::string> &pvUci, int maxPlies);

  // Material 'side' loses over up to 'maxPlies' of a line, in pawn units.
  int materialLoss(const std::string &fen, const std::vector<std::string> &pvUci,
                   core::Color side, int maxPlies);

} // namespace backranq::puzzle
