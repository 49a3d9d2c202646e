#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace backranq::tools::puzzler {

namespace fs = std::filesystem;

enum class Command { Extract, List, Next, Facets, Attempt, Stats, UserStats, Prefs };

struct DefaultPaths {
  fs::path storeFile;
  fs::path prefsFile;
};

// $XDG_DATA_HOME/backranq/{puzzles.db,preferences.ini}
DefaultPaths compute_default_paths();

struct Options {
  Command command = Command::List;

  std::string storePath;
  std::string prefsPath;
  std::string user; // falls back to the preferences username

  // extract
  std::string pgnPath;
  std::string gameId; // default: PGN file stem
  std::string enginePath;
  std::vector<std::string> engineArgs;
  int engineThreads = 1;
  int hashMb = 0;
  std::string evalsPath;     // precomputed evaluations, consulted before the engine
  std::string saveEvalsPath; // write every evaluation used (table + engine results)
  std::string bookPath;      // extra opening book (TSV)
  bool verbose = false;

  // key=value overrides of the analysis settings, in command line order
  std::vector<std::pair<std::string, std::string>> settings;

  // list / next: filters, raw until the command parses them
  std::optional<std::string> listGame;
  std::optional<std::string> typeFilter;  // avoidBlunder | punishBlunder
  std::optional<std::string> kindFilter;  // blunder | missedWin | missedTactic
  std::optional<std::string> phaseFilter; // opening | middlegame | endgame
  std::vector<std::string> ecoFilter;     // any of these codes
  std::string openingFilter;              // substring of code, name or variation
  std::vector<std::string> tagFilter;     // all of these
  std::string solutions = "any";          // any | single | multi
  bool solvedOnly = false;
  bool failedOnly = false;
  int page = 1;
  int limit = 0; // 0: the command's default

  // next
  int count = 1;
  bool preferFailed = false;
  std::vector<std::string> excludeIds;
  std::optional<unsigned> seed;

  // attempt / stats
  std::string puzzleId;
  std::string move;
  std::optional<long long> timeMs;

  // prefs
  bool savePrefs = false;
};

Options parse_args(int argc, char** argv, const DefaultPaths& defaults);

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> split_csv(const std::string& s);

}  // namespace backranq::tools::puzzler
