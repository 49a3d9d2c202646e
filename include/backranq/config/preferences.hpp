#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "backranq/config/analysis_config.hpp"

namespace backranq::config
{
  constexpr int PREFERENCES_VERSION = 1;

  // Per-user settings persisted between runs.
  struct Preferences
  {
    int version{PREFERENCES_VERSION};
    std::string username;   // matched against the White/Black tags to pick the user's color
    std::string enginePath; // UCI engine executable, empty = none configured
    AnalysisConfig analysis{AnalysisConfig::defaults()};
  };

  struct PreferencesPatch
  {
    std::optional<std::string> username;
    std::optional<std::string> enginePath;
    AnalysisConfig analysis; // present fields override
  };

  Preferences mergePreferences(const Preferences &base, const PreferencesPatch &patch);

  // Rewrites a key/value set of an older layout into the current one. Legacy (version 0)
  // files store every field as text where blank means unset; values that do not parse
  // are dropped with a warning instead of failing the load.
  std::map<std::string, std::string> migratePreferences(std::map<std::string, std::string> kv,
                                                        int fromVersion);

  // A missing file yields the defaults. 'migrated' reports a legacy file.
  bool loadPreferences(const std::filesystem::path &path, Preferences &out,
                       std::string *err = nullptr, bool *migrated = nullptr);
  bool savePreferences(const std::filesystem::path &path, const Preferences &prefs,
                       std::string *err = nullptr);

  // $XDG_DATA_HOME/backranq, or ~/.local/share/backranq.
  std::filesystem::path userDataDir();

} // namespace backranq::config
