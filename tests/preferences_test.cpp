#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "backranq/config/preferences.hpp"

using namespace backranq;
using namespace backranq::config;
namespace fs = std::filesystem;

static fs::path scratch(const char *name)
{
  const fs::path p = fs::temp_directory_path() / "backranq_preferences_test" / name;
  fs::create_directories(p.parent_path());
  fs::remove(p);
  return p;
}

int main()
{
  // Resolution against defaults
  {
    const ResolvedConfig r = resolve(AnalysisConfig{});
    assert(r.puzzleMode == PuzzleMode::Both);
    assert(r.movetimeMs == 200 && r.maxPuzzlesPerGame == 5);
    assert(r.blunderSwingCp == 250 && r.missedTacticSwingCp == 180);
    assert(!r.evalBandMinCp && !r.evalBandMaxCp);
    assert(!r.confirmMovetimeMs && !r.uniquenessMarginCp);
    assert(!r.confirmationEnabled());
    assert(r.openingSkipPlies == 8 && r.cooldownPliesAfterPuzzle == 0);
    assert(r.mateCeilingCp == 10000);

    AnalysisConfig c;
    c.confirmMovetimeMs = 0;
    c.uniquenessMarginCp = -5;
    c.multiPv = 1;
    c.maxPuzzlesPerGame = -3;
    c.tacticalLookaheadPlies = 0;
    const ResolvedConfig r2 = resolve(c);
    assert(!r2.confirmMovetimeMs && !r2.uniquenessMarginCp);
    assert(r2.multiPv == 1);
    assert(r2.maxPuzzlesPerGame == 0);
    assert(r2.tacticalLookaheadPlies == 1);

    c.uniquenessMarginCp = 30;
    c.confirmMovetimeMs = 1500;
    const ResolvedConfig r3 = resolve(c);
    assert(r3.multiPv == 2);
    assert(r3.confirmationEnabled());

    const ResolvedConfig preset = resolve(AnalysisConfig::defaults());
    assert(preset.evalBandMinCp == -300 && preset.evalBandMaxCp == 600);
  }

  // key=value access
  {
    AnalysisConfig c;
    std::string err;
    assert(applyConfigValue(c, "puzzleMode", "Punish", &err));
    assert(c.puzzleMode == PuzzleMode::PunishBlunder);
    assert(applyConfigValue(c, "evalBandMinCp", "-250", &err));
    assert(c.evalBandMinCp == -250);
    assert(applyConfigValue(c, "requireTactical", "off", &err));
    assert(c.requireTactical == false);
    assert(applyConfigValue(c, "userColor", "Black", &err));
    assert(c.userColor == core::Color::Black);

    assert(applyConfigValue(c, "evalBandMinCp", "", &err));
    assert(!c.evalBandMinCp);

    assert(!applyConfigValue(c, "movetimeMs", "fast", &err));
    assert(err.find("movetimeMs") != std::string::npos);
    assert(!applyConfigValue(c, "noSuchKey", "1", &err));
    assert(!applyConfigValue(c, "userColor", "green", &err));

    const auto values = configValues(c);
    bool sawMode = false;
    for (const auto &[k, v] : values)
    {
      if (k == "puzzleMode")
      {
        sawMode = true;
        assert(v == "punishBlunder");
      }
      AnalysisConfig probe;
      assert(applyConfigValue(probe, k, v));
    }
    assert(sawMode);
  }

  // Merging a patch only overrides what it carries
  {
    Preferences base;
    base.username = "alice";
    base.enginePath = "/usr/bin/stockfish";

    PreferencesPatch patch;
    patch.username = "  bob ";
    patch.analysis.movetimeMs = 500;
    const Preferences merged = mergePreferences(base, patch);
    assert(merged.username == "bob");
    assert(merged.enginePath == "/usr/bin/stockfish");
    assert(merged.analysis.movetimeMs == 500);
    assert(merged.analysis.evalBandMinCp == -300);
    assert(merged.analysis.blunderSwingCp == base.analysis.blunderSwingCp);
  }

  // A missing file is a first run
  {
    Preferences p;
    p.username = "stale";
    std::string err;
    bool migrated = true;
    assert(loadPreferences(scratch("missing.ini"), p, &err, &migrated));
    assert(!migrated);
    assert(p.username.empty());
    assert(p.analysis.evalBandMaxCp == 600);
  }

  // Save and load
  {
    const fs::path path = scratch("prefs.ini");
    Preferences p;
    p.username = "bob";
    p.enginePath = "/opt/engines/sf";
    p.analysis.uniquenessMarginCp = 40;
    p.analysis.evalBandMinCp.reset();
    p.analysis.userColor = core::Color::White;
    std::string err;
    assert(savePreferences(path, p, &err));
    assert(!fs::exists(path.string() + ".tmp"));

    Preferences q;
    bool migrated = true;
    assert(loadPreferences(path, q, &err, &migrated));
    assert(!migrated);
    assert(q.username == "bob" && q.enginePath == "/opt/engines/sf");
    assert(q.analysis.uniquenessMarginCp == 40);
    assert(!q.analysis.evalBandMinCp);
    assert(q.analysis.evalBandMaxCp == 600);
    assert(q.analysis.userColor == core::Color::White);
  }

  // Legacy layout: renamed keys, UI state dropped, bad values unset
  {
    const fs::path path = scratch("legacy.ini");
    {
      std::ofstream out(path);
      out << "# written by an old build\n"
          << "engineMoveTimeMs=350\n"
          << "lichessUsername=   \n"
          << "chesscomUsername=Bob\n"
          << "puzzleIdx=4\n"
          << "puzzleTagFilter=fork\n"
          << "blunderSwingCp=lots\n"
          << "requireTactical=no\n"
          << "someRetiredKnob=1\n"
          << "enginePath=/usr/games/stockfish\n";
    }

    Preferences p;
    std::string err;
    bool migrated = false;
    assert(loadPreferences(path, p, &err, &migrated));
    assert(migrated);
    assert(p.version == PREFERENCES_VERSION);
    assert(p.username == "Bob");
    assert(p.enginePath == "/usr/games/stockfish");
    assert(p.analysis.movetimeMs == 350);
    assert(!p.analysis.blunderSwingCp);
    assert(p.analysis.requireTactical == false);
    assert(resolve(p.analysis).blunderSwingCp == 250);

    // Migrating again is a no-op once saved in the current layout.
    assert(savePreferences(path, p, &err));
    Preferences again;
    assert(loadPreferences(path, again, &err, &migrated));
    assert(!migrated);
    assert(again.username == "Bob" && again.analysis.movetimeMs == 350);
  }

  // Files from a newer build are refused
  {
    const fs::path path = scratch("future.ini");
    {
      std::ofstream out(path);
      out << "version=99\nusername=x\n";
    }
    Preferences p;
    std::string err;
    assert(!loadPreferences(path, p, &err));
    assert(err.find("newer") != std::string::npos);
  }

  // Unknown keys in a current file are an error
  {
    const fs::path path = scratch("unknown.ini");
    {
      std::ofstream out(path);
      out << "version=1\nnoSuchKey=3\n";
    }
    Preferences p;
    std::string err;
    assert(!loadPreferences(path, p, &err));
    assert(err.find("noSuchKey") != std::string::npos);
  }

  fs::remove_all(fs::temp_directory_path() / "backranq_preferences_test");
  std::cout << "preferences_test passed\n";
  return 0;
}
