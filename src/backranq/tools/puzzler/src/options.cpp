#include "backranq/tools/puzzler/options.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "backranq/config/preferences.hpp"

namespace backranq::tools::puzzler {

std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  auto flush = [&] {
    const auto b = cur.find_first_not_of(" \t");
    if (b != std::string::npos) out.push_back(cur.substr(b, cur.find_last_not_of(" \t") - b + 1));
    cur.clear();
  };
  for (char c : s) {
    if (c == ',')
      flush();
    else
      cur.push_back(c);
  }
  flush();
  return out;
}

DefaultPaths compute_default_paths() {
  const fs::path dir = config::userDataDir();
  return DefaultPaths{dir / "puzzles.db", dir / "preferences.ini"};
}

[[noreturn]] static void usage_and_exit(const DefaultPaths& d) {
  std::cerr
      << "Usage: backranq_puzzler <command> [options]\n"
         "Commands:\n"
         "  extract <game.pgn>        Analyze a game and replace its puzzles\n"
         "  list                      List the user's puzzles\n"
         "  next                      Pick puzzles to solve next\n"
         "  facets                    Opening and tag counts\n"
         "  attempt <puzzle> <move>   Grade a move (UCI) against a puzzle\n"
         "  stats <puzzle>            Attempt statistics of one puzzle\n"
         "  user-stats                Totals over all of the user's puzzles\n"
         "  prefs                     Show (and with --save, store) preferences\n"
         "Common options:\n"
         "  --store <file>            Puzzle store (default " << d.storeFile.string() << ")\n"
         "  --prefs <file>            Preferences (default " << d.prefsFile.string() << ")\n"
         "  --user <name>             User id (default: preferences username)\n"
         "  --set <key=value>         Override an analysis setting (repeatable)\n"
         "Extract options:\n"
         "  --game <id>               Game id (default: PGN file name)\n"
         "  --engine <path>           UCI engine (default: preferences enginePath)\n"
         "  --engine-arg <arg>        Extra engine command line argument (repeatable)\n"
         "  --threads <N>             Engine Threads (default 1)\n"
         "  --hash <MB>               Engine Hash (default engine's)\n"
         "  --evals <file>            Precomputed evaluation table\n"
         "  --save-evals <file>       Write the evaluations used to a table\n"
         "  --book <file>             Extra opening book (eco<TAB>name<TAB>variation<TAB>moves)\n"
         "  --verbose                 Per-move classification and filter counts\n"
         "List and next options:\n"
         "  --list-game <id>          Only puzzles of this game\n"
         "  --type <t>                avoidBlunder or punishBlunder\n"
         "  --kind <k>                blunder, missedWin or missedTactic\n"
         "  --phase <p>               opening, middlegame or endgame\n"
         "  --eco <A00,B01,...>       Any of these ECO codes\n"
         "  --opening <text>          ECO, opening or variation containing text\n"
         "  --tag <tag>               Required tag (repeatable)\n"
         "  --solutions <n>           any, single or multi\n"
         "  --solved / --failed       Solved at least once / attempted, never solved\n"
         "  --page <N>                Page of the list (default 1)\n"
         "  --limit <N>               Page size (list, default 20) or facet count\n"
         "Next options:\n"
         "  --count <N>               Number of puzzles (default 1)\n"
         "  --prefer-failed           Failed puzzles before unattempted ones\n"
         "  --exclude <id,id,...>     Puzzles to skip\n"
         "  --seed <N>                Random seed\n"
         "Attempt options:\n"
         "  --time <ms>               Time spent on the answer\n"
         "Prefs options:\n"
         "  --save                    Store the merged preferences\n";
  std::exit(1);
}

static Command parse_command(const std::string& s, const DefaultPaths& d) {
  if (s == "extract") return Command::Extract;
  if (s == "list") return Command::List;
  if (s == "next") return Command::Next;
  if (s == "facets") return Command::Facets;
  if (s == "attempt") return Command::Attempt;
  if (s == "stats") return Command::Stats;
  if (s == "user-stats") return Command::UserStats;
  if (s == "prefs") return Command::Prefs;
  if (s == "--help" || s == "-h") usage_and_exit(d);
  std::cerr << "Unknown command: " << s << "\n";
  usage_and_exit(d);
}

Options parse_args(int argc, char** argv, const DefaultPaths& defaults) {
  Options o;
  o.storePath = defaults.storeFile.string();
  o.prefsPath = defaults.prefsFile.string();

  if (argc < 2) usage_and_exit(defaults);
  o.command = parse_command(argv[1], defaults);

  auto require_value = [&](int& i, const char* name) -> std::string {
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << name << "\n";
      usage_and_exit(defaults);
    }
    return argv[++i];
  };

  std::vector<std::string> positional;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--store") {
      o.storePath = require_value(i, "--store");
    } else if (arg == "--prefs") {
      o.prefsPath = require_value(i, "--prefs");
    } else if (arg == "--user") {
      o.user = require_value(i, "--user");
    } else if (arg == "--set") {
      const std::string kv = require_value(i, "--set");
      const auto eq = kv.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "Expected key=value for --set, got: " << kv << "\n";
        usage_and_exit(defaults);
      }
      o.settings.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
    } else if (arg == "--game") {
      o.gameId = require_value(i, "--game");
    } else if (arg == "--engine") {
      o.enginePath = require_value(i, "--engine");
    } else if (arg == "--engine-arg") {
      o.engineArgs.push_back(require_value(i, "--engine-arg"));
    } else if (arg == "--threads") {
      o.engineThreads = std::max(1, std::stoi(require_value(i, "--threads")));
    } else if (arg == "--hash") {
      o.hashMb = std::max(0, std::stoi(require_value(i, "--hash")));
    } else if (arg == "--evals") {
      o.evalsPath = require_value(i, "--evals");
    } else if (arg == "--save-evals") {
      o.saveEvalsPath = require_value(i, "--save-evals");
    } else if (arg == "--book") {
      o.bookPath = require_value(i, "--book");
    } else if (arg == "--verbose" || arg == "-v") {
      o.verbose = true;
    } else if (arg == "--list-game") {
      o.listGame = require_value(i, "--list-game");
    } else if (arg == "--type") {
      o.typeFilter = require_value(i, "--type");
    } else if (arg == "--kind") {
      o.kindFilter = require_value(i, "--kind");
    } else if (arg == "--phase") {
      o.phaseFilter = require_value(i, "--phase");
    } else if (arg == "--eco") {
      for (auto& code : split_csv(require_value(i, "--eco"))) o.ecoFilter.push_back(code);
    } else if (arg == "--opening") {
      o.openingFilter = require_value(i, "--opening");
    } else if (arg == "--tag") {
      o.tagFilter.push_back(require_value(i, "--tag"));
    } else if (arg == "--solutions") {
      o.solutions = require_value(i, "--solutions");
    } else if (arg == "--solved") {
      o.solvedOnly = true;
    } else if (arg == "--failed") {
      o.failedOnly = true;
    } else if (arg == "--page") {
      o.page = std::stoi(require_value(i, "--page"));
    } else if (arg == "--limit") {
      o.limit = std::stoi(require_value(i, "--limit"));
    } else if (arg == "--count") {
      o.count = std::stoi(require_value(i, "--count"));
    } else if (arg == "--prefer-failed") {
      o.preferFailed = true;
    } else if (arg == "--exclude") {
      for (auto& id : split_csv(require_value(i, "--exclude"))) o.excludeIds.push_back(id);
    } else if (arg == "--seed") {
      o.seed = static_cast<unsigned>(std::stoul(require_value(i, "--seed")));
    } else if (arg == "--time") {
      o.timeMs = std::stoll(require_value(i, "--time"));
    } else if (arg == "--save") {
      o.savePrefs = true;
    } else if (arg == "--help" || arg == "-h") {
      usage_and_exit(defaults);
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Unknown option: " << arg << "\n";
      usage_and_exit(defaults);
    } else {
      positional.push_back(arg);
    }
  }

  auto expect_positional = [&](std::size_t n, const char* what) {
    if (positional.size() != n) {
      std::cerr << "Expected " << what << "\n";
      usage_and_exit(defaults);
    }
  };

  switch (o.command) {
    case Command::Extract:
      expect_positional(1, "one PGN file");
      o.pgnPath = positional[0];
      if (o.gameId.empty()) o.gameId = fs::path(o.pgnPath).stem().string();
      break;
    case Command::Attempt:
      expect_positional(2, "a puzzle id and a move");
      o.puzzleId = positional[0];
      o.move = positional[1];
      break;
    case Command::Stats:
      expect_positional(1, "a puzzle id");
      o.puzzleId = positional[0];
      break;
    case Command::List:
    case Command::Next:
    case Command::Facets:
    case Command::UserStats:
    case Command::Prefs:
      expect_positional(0, "no positional arguments");
      break;
  }
  return o;
}

}  // namespace backranq::tools::puzzler
