#include "backranq/tools/puzzler/commands.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

#include "backranq/config/preferences.hpp"
#include "backranq/engine/precomputed_evaluator.hpp"
#include "backranq/engine/uci/uci_evaluator.hpp"
#include "backranq/model/analysis/opening_classifier.hpp"
#include "backranq/model/analysis/pgn_reader.hpp"
#include "backranq/puzzle/attempt_grader.hpp"
#include "backranq/puzzle/game_analyzer.hpp"
#include "backranq/puzzle/puzzle_extractor.hpp"
#include "backranq/puzzle/puzzle_query.hpp"
#include "backranq/puzzle/puzzle_store.hpp"
#include "backranq/puzzle/sync_coordinator.hpp"

namespace backranq::tools::puzzler {

namespace {

config::Preferences load_prefs(const Options& o) {
  config::Preferences prefs;
  std::string err;
  bool migrated = false;
  if (!config::loadPreferences(o.prefsPath, prefs, &err, &migrated))
    throw std::runtime_error(err);
  if (migrated) {
    // Write the current layout back so the migration runs once.
    if (!config::savePreferences(o.prefsPath, prefs, &err))
      std::cerr << "[Puzzler] could not rewrite migrated preferences: " << err << "\n";
  }
  for (const auto& [key, value] : o.settings) {
    if (!config::applyConfigValue(prefs.analysis, key, value, &err))
      throw std::runtime_error("--set " + key + ": " + err);
  }
  return prefs;
}

std::string resolve_user(const Options& o, const config::Preferences& prefs) {
  const std::string user = !o.user.empty() ? o.user : prefs.username;
  if (user.empty())
    throw std::runtime_error("no user: pass --user or set a username in the preferences");
  if (!puzzle::isValidStoreId(user))
    throw std::runtime_error("invalid user id: " + user);
  return user;
}

std::unique_ptr<puzzle::FilePuzzleRepository> open_store(const Options& o) {
  auto repo = std::make_unique<puzzle::FilePuzzleRepository>(o.storePath);
  std::string err;
  if (!repo->load(&err)) throw std::runtime_error(err);
  return repo;
}

std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("Cannot open " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::string format_rate(const std::optional<double>& rate) {
  if (!rate) return "-";
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << (*rate * 100.0) << "%";
  return ss.str();
}

std::string format_opening(const model::analysis::OpeningInfo& op) {
  std::string s = op.eco.value_or("?");
  if (op.name) s += " " + *op.name;
  if (op.variation) s += ": " + *op.variation;
  s += std::string(" (") + model::analysis::toString(op.source) + ")";
  return s;
}

void print_side(std::ostream& out, const char* name, const puzzle::SideSummary& s) {
  out << "  " << name << ": ";
  if (!s.accuracy) {
    out << "no classified moves\n";
    return;
  }
  out << std::fixed << std::setprecision(1) << "accuracy " << *s.accuracy << ", avg loss "
      << s.averageLossCp << "cp, " << s.inaccuracies << " inaccuracies, " << s.mistakes
      << " mistakes, " << s.blunders << " blunders\n";
}

void print_puzzle(std::ostream& out, const puzzle::Puzzle& p) {
  out << p.id << "  " << puzzle::toString(p.type) << "  " << puzzle::toString(p.category) << "  "
      << (p.severity ? puzzle::toString(*p.severity) : "-") << "  " << puzzle::toString(p.phase)
      << "  swing=" << p.swingCp << "  best=" << p.bestMoveUci << "\n"
      << "    " << p.fen << "\n";
  if (!p.tags.empty()) {
    out << "    tags:";
    for (const auto& t : p.tags) out << " " << t;
    out << "\n";
  }
}

void print_attempt_stats(std::ostream& out, const puzzle::AttemptStats& s) {
  out << "attempts=" << s.attempted << " correct=" << s.correct
      << " success=" << format_rate(s.successRate) << " streak=" << s.currentStreak
      << (s.solved ? " solved" : "") << (s.failed ? " failed" : "") << "\n";
  if (s.averageTimeMs)
    out << "average time: " << std::fixed << std::setprecision(0) << *s.averageTimeMs << "ms\n";
  for (const auto& a : s.history)
    out << "  " << a.id << "  " << a.userMoveUci << "  " << (a.wasCorrect ? "correct" : "wrong")
        << "\n";
}

void print_row(std::ostream& out, const puzzle::PuzzleWithStats& row) {
  print_puzzle(out, row.puzzle);
  const auto& s = row.stats;
  if (s.attempted > 0)
    out << "    attempts=" << s.attempted << " correct=" << s.correct
        << (s.solved ? " solved" : " failed") << "\n";
}

// Command line filter values, checked.
puzzle::PuzzleFilter build_filter(const Options& o) {
  puzzle::PuzzleFilter f;
  f.gameId = o.listGame;
  if (o.typeFilter) {
    f.type = puzzle::parsePuzzleType(*o.typeFilter);
    if (!f.type) throw std::runtime_error("unknown puzzle type: " + *o.typeFilter);
  }
  if (o.kindFilter) {
    f.category = puzzle::parseCategory(*o.kindFilter);
    if (!f.category) throw std::runtime_error("unknown puzzle kind: " + *o.kindFilter);
  }
  if (o.phaseFilter) {
    f.phase = puzzle::parsePhase(*o.phaseFilter);
    if (!f.phase) throw std::runtime_error("unknown phase: " + *o.phaseFilter);
  }
  const auto solutions = puzzle::parseSolutionCount(o.solutions);
  if (!solutions) throw std::runtime_error("--solutions must be any, single or multi");
  f.solutions = *solutions;
  f.openingEcos = o.ecoFilter;
  f.opening = o.openingFilter;
  f.tags = o.tagFilter;
  f.solved = o.solvedOnly;
  f.failed = o.failedOnly;
  return puzzle::normalizeFilter(std::move(f));
}

}  // namespace

int run_extract(const Options& o, std::ostream& out) {
  config::Preferences prefs = load_prefs(o);
  const std::string user = resolve_user(o, prefs);
  if (!puzzle::isValidStoreId(o.gameId))
    throw std::runtime_error("invalid game id: " + o.gameId);

  model::analysis::GameRecord game;
  std::string err;
  if (!model::analysis::parsePgnToRecord(read_file(o.pgnPath), game, &err))
    throw std::runtime_error(o.pgnPath + ": " + err);

  config::AnalysisConfig cfg = prefs.analysis;
  if (!cfg.userColor) {
    const std::string name = !prefs.username.empty() ? prefs.username : user;
    cfg.userColor = puzzle::playerColor(game, name);
    if (!cfg.userColor)
      std::cerr << "[Puzzler] " << name << " is not a player of this game, "
                << "extracting for both sides\n";
  }
  const config::ResolvedConfig rc = config::resolve(cfg);

  // Engine behind the table: table hits are served directly, misses go to the engine.
  std::unique_ptr<engine::uci::UciEvaluator> uci;
  const std::string enginePath = !o.enginePath.empty() ? o.enginePath : prefs.enginePath;
  if (!enginePath.empty()) {
    engine::uci::UciEvaluatorOptions eo;
    eo.exePath = enginePath;
    eo.args = o.engineArgs;
    eo.threads = o.engineThreads;
    eo.hashMb = o.hashMb;
    eo.defaultMovetimeMs = rc.movetimeMs;
    uci = std::make_unique<engine::uci::UciEvaluator>(eo);
    if (!uci->start(&err)) {
      if (o.evalsPath.empty()) throw std::runtime_error("could not start engine: " + err);
      std::cerr << "[Puzzler] could not start engine (" << err
                << "), using the evaluation table only\n";
      uci.reset();
    } else if (o.verbose) {
      std::cerr << "[Puzzler] engine: " << uci->engineId().name << "\n";
    }
  }
  if (!uci && o.evalsPath.empty())
    throw std::runtime_error("no evaluator: pass --engine, set enginePath, or pass --evals");

  engine::PrecomputedEvaluator table(uci.get());
  if (!o.evalsPath.empty()) {
    if (!fs::exists(o.evalsPath) && o.evalsPath == o.saveEvalsPath) {
      // First run of a cache that is about to be written.
    } else if (!table.loadFromFile(o.evalsPath, &err)) {
      throw std::runtime_error(err.empty() ? o.evalsPath + ": no evaluations" : err);
    }
  }

  puzzle::GameAnalyzer analyzer(table, rc);
  if (o.verbose)
    analyzer.setProgress([](int pos, int count) {
      std::cerr << "\r[Puzzler] evaluating " << pos << "/" << count << std::flush;
      if (pos == count) std::cerr << "\n";
    });
  // Confirmation needs a deeper search than the scan, which only the engine can give.
  engine::EvaluationAdapter* confirmer = uci.get();
  if (rc.confirmationEnabled() && !confirmer)
    std::cerr << "[Puzzler] confirmation needs a running engine, skipped\n";
  puzzle::PuzzleExtractor extractor(rc, confirmer);

  model::analysis::OpeningBook book = model::analysis::OpeningBook::builtin();
  if (!o.bookPath.empty() && !book.loadFromTsvFile(o.bookPath, &err))
    throw std::runtime_error(err);

  auto repo = open_store(o);
  puzzle::SyncCoordinator sync(*repo);
  const puzzle::ExtractReport report =
      sync.extractAndReplace(user, o.gameId, game, analyzer, extractor, book);

  if (!o.saveEvalsPath.empty() && !table.saveToFile(o.saveEvalsPath, &err))
    std::cerr << "[Puzzler] " << err << "\n";
  if (uci) uci->shutdown();

  out << "Game " << o.gameId << ": " << game.plies.size() << " plies, opening "
      << format_opening(report.opening) << "\n";
  if (report.failedPositions > 0)
    out << "  " << report.failedPositions << " positions could not be evaluated\n";
  print_side(out, "White", report.classified.white);
  print_side(out, "Black", report.classified.black);

  if (o.verbose) {
    for (const auto& m : report.classified.moves) {
      if (!m.classified()) continue;
      out << "    " << std::setw(3) << m.ply << " " << std::setw(7) << m.san << " "
          << std::setw(10) << puzzle::toString(m.label) << " swing " << *m.swingCp << "\n";
    }
    const auto& s = report.extraction;
    out << "  scanned " << s.scannedPlies << " plies, " << s.mistakes << " mistakes, " << s.framings
        << " framings; rejected: band "
        << s.rejectedBand << ", swing " << s.rejectedSwing << ", uniqueness "
        << s.rejectedUniqueness << ", tactical " << s.rejectedTactical << ", trivial "
        << s.rejectedTrivial << ", line " << s.rejectedLine << ", punished "
        << s.rejectedPunished << ", cooldown " << s.skippedCooldown << "\n"
        << "  candidates " << s.candidates << ", confirmed " << s.confirmed << ", dropped "
        << s.droppedByConfirmation << ", over cap " << s.truncated << "\n";
  }

  out << "Stored " << report.replace.stored << " puzzles";
  if (report.replace.droppedInvalid || report.replace.droppedDuplicate)
    out << " (" << report.replace.droppedInvalid << " invalid, "
        << report.replace.droppedDuplicate << " duplicate)";
  out << "\n";
  for (const auto& p : repo->puzzlesForGame(user, o.gameId)) print_puzzle(out, p);
  return 0;
}

int run_list(const Options& o, std::ostream& out) {
  const config::Preferences prefs = load_prefs(o);
  const std::string user = resolve_user(o, prefs);
  auto repo = open_store(o);

  const puzzle::PuzzlePage page =
      puzzle::queryPuzzles(*repo, user, build_filter(o), o.page, o.limit > 0 ? o.limit : 20);
  for (const auto& row : page.puzzles) print_row(out, row);
  out << page.total << " puzzles, page " << page.page << "/" << page.totalPages << "\n";
  return 0;
}

int run_next(const Options& o, std::ostream& out) {
  const config::Preferences prefs = load_prefs(o);
  const std::string user = resolve_user(o, prefs);
  auto repo = open_store(o);

  puzzle::NextPuzzleOptions next;
  next.count = o.count;
  next.preferFailed = o.preferFailed;
  next.excludeIds = o.excludeIds;
  std::mt19937 rng(o.seed ? *o.seed : std::random_device{}());

  const auto rows = puzzle::pickNextPuzzles(*repo, user, build_filter(o), next, rng);
  if (rows.empty()) {
    out << "No puzzles match\n";
    return 0;
  }
  for (const auto& row : rows) print_row(out, row);
  return 0;
}

int run_facets(const Options& o, std::ostream& out) {
  const config::Preferences prefs = load_prefs(o);
  const std::string user = resolve_user(o, prefs);
  auto repo = open_store(o);

  const puzzle::PuzzleFacets f = puzzle::puzzleFacets(*repo, user, o.limit > 0 ? o.limit : 200);
  out << "Openings:\n";
  for (const auto& c : f.openings) out << "  " << c.label << ": " << c.count << "\n";
  out << "Tags:\n";
  for (const auto& c : f.tags) out << "  " << c.value << ": " << c.count << "\n";
  return 0;
}

int run_attempt(const Options& o, std::ostream& out) {
  const config::Preferences prefs = load_prefs(o);
  const std::string user = resolve_user(o, prefs);
  auto repo = open_store(o);

  puzzle::AttemptGrader grader(*repo);
  const puzzle::AttemptOutcome res = grader.submit(user, o.puzzleId, o.move, o.timeMs);
  if (res.status != puzzle::AttemptStatus::Ok)
    throw std::runtime_error(std::string(puzzle::toString(res.status)) + ": " + res.error);

  out << (res.attempt->wasCorrect ? "Correct" : "Incorrect") << " (" << res.attempt->userMoveUci
      << ")\n";
  print_attempt_stats(out, res.stats);
  return 0;
}

int run_stats(const Options& o, std::ostream& out) {
  const config::Preferences prefs = load_prefs(o);
  const std::string user = resolve_user(o, prefs);
  auto repo = open_store(o);

  const auto p = repo->findPuzzle(o.puzzleId);
  if (!p || p->userId != user) throw std::runtime_error("puzzle not found: " + o.puzzleId);

  puzzle::AttemptGrader grader(*repo);
  print_puzzle(out, *p);
  print_attempt_stats(out, grader.stats(user, o.puzzleId));
  return 0;
}

int run_user_stats(const Options& o, std::ostream& out) {
  const config::Preferences prefs = load_prefs(o);
  const std::string user = resolve_user(o, prefs);
  auto repo = open_store(o);

  puzzle::AttemptGrader grader(*repo);
  const puzzle::UserStats s = grader.userStats(user);
  const auto& t = s.totals;
  out << "User " << user << ": " << t.puzzles << " puzzles, " << t.attemptedPuzzles
      << " attempted, " << t.solvedPuzzles << " solved, " << t.failedPuzzles << " failed\n"
      << "Attempts: " << t.attempts << " (" << t.correctAttempts << " correct, "
      << format_rate(t.successRate) << ")\n";
  for (const auto& [type, n] : s.byType) out << "  " << puzzle::toString(type) << ": " << n << "\n";
  if (!s.topOpenings.empty()) {
    out << "Openings:\n";
    for (const auto& [eco, n] : s.topOpenings) out << "  " << eco << ": " << n << "\n";
  }
  if (!s.recentAttempts.empty()) {
    out << "Recent:\n";
    for (const auto& a : s.recentAttempts)
      out << "  " << a.puzzleId << "  " << a.userMoveUci << "  "
          << (a.wasCorrect ? "correct" : "wrong") << "\n";
  }
  return 0;
}

int run_prefs(const Options& o, std::ostream& out) {
  config::Preferences prefs = load_prefs(o);

  config::PreferencesPatch patch;
  if (!o.user.empty()) patch.username = o.user;
  if (!o.enginePath.empty()) patch.enginePath = o.enginePath;
  prefs = config::mergePreferences(prefs, patch);

  out << "version=" << prefs.version << "\n"
      << "username=" << prefs.username << "\n"
      << "enginePath=" << prefs.enginePath << "\n";
  for (const auto& [key, value] : config::configValues(prefs.analysis))
    out << key << "=" << value << "\n";

  if (o.savePrefs) {
    std::string err;
    if (!config::savePreferences(o.prefsPath, prefs, &err)) throw std::runtime_error(err);
    out << "Saved " << o.prefsPath << "\n";
  }
  return 0;
}

int run_command(const Options& o, std::ostream& out) {
  switch (o.command) {
    case Command::Extract:
      return run_extract(o, out);
    case Command::List:
      return run_list(o, out);
    case Command::Next:
      return run_next(o, out);
    case Command::Facets:
      return run_facets(o, out);
    case Command::Attempt:
      return run_attempt(o, out);
    case Command::Stats:
      return run_stats(o, out);
    case Command::UserStats:
      return run_user_stats(o, out);
    case Command::Prefs:
      return run_prefs(o, out);
  }
  return 1;
}

int run_main(int argc, char** argv, std::ostream& out, std::ostream& err) {
  try {
    const DefaultPaths defaults = compute_default_paths();
    const Options opts = parse_args(argc, argv, defaults);
    return run_command(opts, out);
  } catch (const std::exception& e) {
    err << "Error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace backranq::tools::puzzler
