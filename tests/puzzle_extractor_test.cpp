#include <algorithm>
#include <cassert>
#include <iostream>

#include "backranq/puzzle/game_analyzer.hpp"
#include "backranq/puzzle/puzzle_extractor.hpp"
#include "test_support.hpp"

using namespace backranq;
using puzzle::PuzzleType;

static puzzle::AnalyzedGame analyzeScholar(const config::ResolvedConfig &cfg)
{
  static engine::PrecomputedEvaluator table;
  if (table.size() == 0)
    test::addScholarEvals(table, test::scholarGame());
  puzzle::GameAnalyzer analyzer(table, cfg);
  return analyzer.analyze(test::scholarGame());
}

static puzzle::ExtractionResult extractWith(const config::AnalysisConfig &acfg,
                                            engine::EvaluationAdapter *confirmer = nullptr)
{
  const config::ResolvedConfig cfg = config::resolve(acfg);
  const puzzle::AnalyzedGame game = analyzeScholar(cfg);
  puzzle::PuzzleExtractor extractor(cfg, confirmer, std::chrono::milliseconds(500));
  puzzle::ExtractionInput in;
  in.game = &game;
  in.userId = "bob";
  in.gameId = "g1";
  return extractor.extract(in);
}

// Scholar evaluations with some positions re-scored.
static puzzle::ExtractionResult extractRescored(
    const config::AnalysisConfig &acfg,
    std::initializer_list<std::pair<int, engine::EvalSnapshot>> overrides)
{
  const config::ResolvedConfig cfg = config::resolve(acfg);
  const auto rec = test::scholarGame();
  engine::PrecomputedEvaluator table;
  test::addScholarEvals(table, rec);
  for (const auto &[idx, snap] : overrides)
    table.add(rec.fenAt(idx), snap);
  puzzle::GameAnalyzer analyzer(table, cfg);
  const puzzle::AnalyzedGame game = analyzer.analyze(rec);
  puzzle::PuzzleExtractor extractor(cfg);
  puzzle::ExtractionInput in;
  in.game = &game;
  in.userId = "bob";
  in.gameId = "g1";
  return extractor.extract(in);
}

static bool hasType(const std::vector<puzzle::Puzzle> &ps, PuzzleType t)
{
  return std::any_of(ps.begin(), ps.end(), [t](const puzzle::Puzzle &p)
                     { return p.type == t; });
}

int main()
{
  // Line scanning
  {
    const auto rec = test::scholarGame();
    auto sig = puzzle::scanLine(rec.fenAt(6), {"h5f7"}, 4);
    assert(sig.applied == 1 && sig.capture && sig.check && sig.tactical());

    sig = puzzle::scanLine(rec.fenAt(5), {"g7g6", "h5f3", "g8f6"}, 4);
    assert(sig.applied == 3 && !sig.tactical());

    // Stops at the first illegal move.
    sig = puzzle::scanLine(rec.fenAt(5), {"g7g6", "h5h8", "h5f7"}, 4);
    assert(sig.applied == 1 && !sig.capture);

    // Lookahead bound
    sig = puzzle::scanLine(rec.fenAt(5), {"g7g6", "h5f3", "c6d4", "f3f7"}, 3);
    assert(sig.applied == 3 && !sig.tactical());

    assert(puzzle::materialLoss(rec.fenAt(6), {"h5f7"}, core::Color::Black, 4) == 1);
    assert(puzzle::materialLoss(rec.fenAt(6), {"h5f7"}, core::Color::White, 4) == 0);
  }

  // Both framings of the blunder
  {
    const auto res = extractWith(test::scholarConfig());
    assert(res.puzzles.size() == 2);

    const auto &avoid = res.puzzles[0];
    assert(avoid.type == PuzzleType::AvoidBlunder);
    assert(avoid.sourcePly == 5);
    assert(avoid.sideToMove == core::Color::Black);
    assert(avoid.fen == test::scholarGame().fenAt(5));
    assert(avoid.bestMoveUci == "g7g6");
    assert(avoid.bestLineUci.size() == 4);
    assert(avoid.category == puzzle::Category::Blunder);
    assert(avoid.severity && *avoid.severity == puzzle::Severity::Big);
    assert(avoid.phase == puzzle::Phase::Opening);
    assert(avoid.swingCp == 9980);
    assert(avoid.score && *avoid.score == engine::Score::cp(-20));
    assert((avoid.tags == std::vector<std::string>{"capture", "check", "kind:avoidBlunder"}));
    assert(avoid.label == "Find the best move (avoid the mistake)");
    assert(avoid.id == "bob:g1:5:avoidBlunder");
    assert(avoid.userId == "bob" && avoid.gameId == "g1");
    // The second line is 20cp worse, outside the best margin.
    assert(avoid.acceptedMovesUci == std::vector<std::string>{"g7g6"});

    const auto &punish = res.puzzles[1];
    assert(punish.type == PuzzleType::PunishBlunder);
    assert(punish.sourcePly == 6);
    assert(punish.sideToMove == core::Color::White);
    assert(punish.bestMoveUci == "h5f7");
    assert(std::find(punish.motifs.begin(), punish.motifs.end(), puzzle::Motif::MateThreat) !=
           punish.motifs.end());
    assert(std::find(punish.motifs.begin(), punish.motifs.end(), puzzle::Motif::HangingPiece) ==
           punish.motifs.end());
    assert(punish.label == "Punish the blunder!");
    assert(punish.id == "bob:g1:6:punishBlunder");

    assert(res.stats.candidates == 2);
    assert(res.stats.truncated == 0);
  }

  // The opponent already found the refutation
  {
    auto cfg = test::scholarConfig();
    cfg.skipPunishedBlunders = true;
    const auto res = extractWith(cfg);
    assert(res.puzzles.size() == 1);
    assert(res.puzzles[0].type == PuzzleType::AvoidBlunder);
    assert(res.stats.rejectedPunished == 1);
  }

  // Mode coverage
  {
    auto cfg = test::scholarConfig();
    cfg.puzzleMode = config::PuzzleMode::AvoidBlunder;
    auto res = extractWith(cfg);
    assert(!res.puzzles.empty());
    assert(!hasType(res.puzzles, PuzzleType::PunishBlunder));

    cfg.puzzleMode = config::PuzzleMode::PunishBlunder;
    res = extractWith(cfg);
    assert(!res.puzzles.empty());
    assert(!hasType(res.puzzles, PuzzleType::AvoidBlunder));

    cfg.puzzleMode = config::PuzzleMode::Both;
    res = extractWith(cfg);
    assert(hasType(res.puzzles, PuzzleType::AvoidBlunder));
    assert(hasType(res.puzzles, PuzzleType::PunishBlunder));
  }

  // Only puzzles the user has to solve
  {
    auto cfg = test::scholarConfig();
    cfg.userColor = core::Color::White;
    auto res = extractWith(cfg);
    assert(res.puzzles.size() == 1);
    assert(res.puzzles[0].sideToMove == core::Color::White);

    cfg.userColor = core::Color::Black;
    res = extractWith(cfg);
    assert(res.puzzles.size() == 1);
    assert(res.puzzles[0].sideToMove == core::Color::Black);
  }

  // Uniqueness: a wider margin never yields more puzzles
  {
    std::size_t previous = 100;
    for (int margin : {1, 10, 20, 50, 1000, 20000})
    {
      auto cfg = test::scholarConfig();
      cfg.uniquenessMarginCp = margin;
      const auto res = extractWith(cfg);
      assert(res.puzzles.size() <= previous);
      previous = res.puzzles.size();
      if (margin == 50)
      {
        assert(res.puzzles.size() == 1);
        assert(res.puzzles[0].type == PuzzleType::PunishBlunder);
        assert(res.stats.rejectedUniqueness == 1);
      }
    }
    assert(previous == 0);
  }

  // Eval band
  {
    auto cfg = test::scholarConfig();
    cfg.evalBandMinCp = -300;
    cfg.evalBandMaxCp = 600;
    const auto res = extractWith(cfg);
    assert(res.puzzles.size() == 1);
    assert(res.puzzles[0].type == PuzzleType::AvoidBlunder);
    assert(res.stats.rejectedBand == 1);
  }

  // Non-tactical lines
  {
    auto cfg = test::scholarConfig();
    cfg.tacticalLookaheadPlies = 2;
    auto res = extractWith(cfg);
    assert(res.puzzles.size() == 1);
    assert(res.stats.rejectedTactical == 1);

    cfg.requireTactical = false;
    res = extractWith(cfg);
    assert(res.puzzles.size() == 2);
  }

  // Short principal lines
  {
    auto cfg = test::scholarConfig();
    cfg.minPvMoves = 2;
    const auto res = extractWith(cfg);
    assert(res.puzzles.size() == 1);
    assert(res.puzzles[0].type == PuzzleType::AvoidBlunder);
    assert(res.stats.rejectedLine == 1);
  }

  // Trivial material
  {
    auto cfg = test::scholarConfig();
    cfg.minNonKingPieces = 40;
    auto res = extractWith(cfg);
    assert(res.puzzles.empty());
    assert(res.stats.rejectedTrivial == 2);

    cfg.skipTrivialEndgames = false;
    res = extractWith(cfg);
    assert(res.puzzles.size() == 2);
  }

  // Opening skip covers the blunder
  {
    auto cfg = test::scholarConfig();
    cfg.openingSkipPlies = 6;
    const auto res = extractWith(cfg);
    assert(res.puzzles.empty());
  }

  // Cap keeps the most severe, earliest puzzles
  {
    auto cfg = test::scholarConfig();
    cfg.maxPuzzlesPerGame = 1;
    const auto res = extractWith(cfg);
    assert(res.puzzles.size() == 1);
    assert(res.puzzles[0].sourcePly == 5);
    assert(res.stats.truncated == 1);
  }

  // A more severe mistake later in the game wins the cap over an earlier, smaller one
  {
    // Before 2...Nc6 black could have won material with 2...g6; Nc6 gives up 190cp.
    auto cfg = test::scholarConfig();
    cfg.puzzleMode = config::PuzzleMode::AvoidBlunder;
    const auto all = extractRescored(
        cfg, {{3, test::snapshot(18, {test::line("cp 170", "g7g6 h5e5 d8e7 e5h8"),
                                      test::line("cp -10", "b8c6 f1c4")})}});
    assert(all.puzzles.size() == 2);
    assert(all.puzzles[0].sourcePly == 5);
    assert(*all.puzzles[0].severity == puzzle::Severity::Big);
    assert(all.puzzles[1].sourcePly == 3);
    assert(all.puzzles[1].swingCp == 190);
    assert(*all.puzzles[1].severity == puzzle::Severity::Small);
    assert(all.puzzles[1].category == puzzle::Category::MissedTactic);

    cfg.maxPuzzlesPerGame = 1;
    const auto capped = extractRescored(
        cfg, {{3, test::snapshot(18, {test::line("cp 170", "g7g6 h5e5 d8e7 e5h8"),
                                      test::line("cp -10", "b8c6 f1c4")})}});
    assert(capped.puzzles.size() == 1);
    assert(capped.puzzles[0].sourcePly == 5);
    assert(capped.stats.truncated == 1);
  }

  // The engine's own choice is never a puzzle, whatever the swing
  {
    // 3...Nf6 is ranked first here, so the mate that follows is not the mover's fault.
    const auto res = extractRescored(
        test::scholarConfig(),
        {{5, test::snapshot(18, {test::line("cp -20", "g8f6 h5f7"),
                                 test::line("cp -40", "g7g6 h5f3")})}});
    assert(res.puzzles.empty());
    assert(res.stats.mistakes == 0);
    assert(res.stats.framings == 0);
    assert(res.stats.scannedPlies == 7);
  }

  // Only mistakes are framed
  {
    const auto res = extractWith(test::scholarConfig());
    assert(res.stats.mistakes == 1);
    assert(res.stats.framings == 2);
  }

  // Same input, same output
  {
    const auto a = extractWith(test::scholarConfig());
    const auto b = extractWith(test::scholarConfig());
    assert(a.puzzles.size() == b.puzzles.size());
    for (std::size_t i = 0; i < a.puzzles.size(); ++i)
    {
      assert(a.puzzles[i].id == b.puzzles[i].id);
      assert(a.puzzles[i].fen == b.puzzles[i].fen);
      assert(a.puzzles[i].bestLineUci == b.puzzles[i].bestLineUci);
      assert(a.puzzles[i].tags == b.puzzles[i].tags);
      assert(a.puzzles[i].swingCp == b.puzzles[i].swingCp);
    }
  }

  // Confirmation at a longer budget
  {
    const auto rec = test::scholarGame();
    engine::PrecomputedEvaluator deep;
    // Deeper search prefers another defence before the blunder, and still mates after it.
    deep.add(rec.fenAt(5), test::snapshot(20, {test::line("cp -15", "d8e7 g1f3 g8f6 f3g5"),
                                               test::line("cp -25", "g7g6 h5f3")}));
    deep.add(rec.fenAt(6), test::snapshot(20, {test::line("mate 1", "h5f7"),
                                               test::line("cp 60", "d2d3 d7d5")}));

    auto cfg = test::scholarConfig();
    cfg.confirmMovetimeMs = 1000;
    const auto res = extractWith(cfg, &deep);
    assert(res.stats.candidates == 2);
    assert(res.stats.confirmed == 1);
    assert(res.stats.droppedByConfirmation == 1);
    assert(res.puzzles.size() == 1);
    assert(res.puzzles[0].type == PuzzleType::PunishBlunder);

    // No confirmer answer at all drops everything.
    engine::PrecomputedEvaluator empty;
    const auto none = extractWith(cfg, &empty);
    assert(none.puzzles.empty());
    assert(none.stats.droppedByConfirmation == 2);

    // Confirmation budget not above the scan budget: stage disabled.
    cfg.confirmMovetimeMs = 100;
    const auto off = extractWith(cfg, &empty);
    assert(off.puzzles.size() == 2);
  }

  // A confirmation no deeper than the scan confirms nothing
  {
    engine::PrecomputedEvaluator same;
    test::addScholarEvals(same, test::scholarGame());

    auto cfg = test::scholarConfig();
    cfg.confirmMovetimeMs = 1000;
    const auto res = extractWith(cfg, &same);
    assert(res.stats.candidates == 2);
    assert(res.stats.confirmed == 0);
    assert(res.stats.droppedByConfirmation == 2);
    assert(res.puzzles.empty());
  }

  // Confirmation replaces the swing with the deeper one
  {
    const auto rec = test::scholarGame();
    engine::PrecomputedEvaluator deep;
    deep.add(rec.fenAt(5), test::snapshot(20, {test::line("cp -120", "g7g6 h5f3 c6d4 f3f7"),
                                               test::line("cp -400", "d8e7 g1f3")}));
    deep.add(rec.fenAt(6), test::snapshot(20, {test::line("cp 200", "h5f7"),
                                               test::line("cp 40", "d2d3 d7d5")}));
    auto cfg = test::scholarConfig();
    cfg.confirmMovetimeMs = 1000;
    const auto res = extractWith(cfg, &deep);
    assert(res.puzzles.size() == 2);
    const auto &avoid = res.puzzles[0];
    assert(avoid.type == PuzzleType::AvoidBlunder);
    assert(avoid.swingCp == -120 + 10000);
    const auto &punish = res.puzzles[1];
    // Before the blunder black stood at -20; white's deeper view is +200.
    assert(punish.swingCp == -20 + 200);
    // Winning start and a swing between the missed-win and blunder thresholds.
    assert(punish.category == puzzle::Category::MissedWin);
    assert(punish.severity && *punish.severity == puzzle::Severity::Small);
  }

  // No game, no puzzles
  {
    puzzle::PuzzleExtractor extractor(config::resolve(test::scholarConfig()));
    const auto res = extractor.extract(puzzle::ExtractionInput{});
    assert(res.puzzles.empty());
  }

  std::cout << "puzzle_extractor_test passed\n";
  return 0;
}
