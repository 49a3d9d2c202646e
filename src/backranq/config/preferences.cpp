#include "backranq/config/preferences.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace backranq::config
{
  namespace fs = std::filesystem;

  static std::string trim(std::string s)
  {
    auto issp = [](unsigned char c)
    { return std::isspace(c); };
    while (!s.empty() && issp((unsigned char)s.front()))
      s.erase(s.begin());
    while (!s.empty() && issp((unsigned char)s.back()))
      s.pop_back();
    return s;
  }

  // Legacy key -> current key. Keys not listed keep their name.
  static const std::map<std::string, std::string> &legacyRenames()
  {
    static const std::map<std::string, std::string> m = {
        {"engineMoveTimeMs", "movetimeMs"},
        {"lichessUsername", "username"},
        {"chesscomUsername", "username"},
    };
    return m;
  }

  // Library/UI state the old layout carried; it has no meaning here.
  static bool isDroppedLegacyKey(const std::string &k)
  {
    return k == "puzzleIdx" || k == "puzzleTagFilter" || k == "puzzleOpeningFilter" ||
           k == "timeClass" || k == "rated" || k == "since" || k == "until" || k == "minElo" ||
           k == "maxElo" || k == "max";
  }

  Preferences mergePreferences(const Preferences &base, const PreferencesPatch &patch)
  {
    Preferences out = base;
    if (patch.username)
      out.username = trim(*patch.username);
    if (patch.enginePath)
      out.enginePath = trim(*patch.enginePath);
    out.analysis = base.analysis.mergedWith(patch.analysis);
    out.version = PREFERENCES_VERSION;
    return out;
  }

  std::map<std::string, std::string> migratePreferences(std::map<std::string, std::string> kv,
                                                        int fromVersion)
  {
    if (fromVersion >= PREFERENCES_VERSION)
      return kv;

    std::map<std::string, std::string> out;
    for (auto &[key, raw] : kv)
    {
      if (isDroppedLegacyKey(key))
        continue;

      std::string value = trim(raw);
      auto rn = legacyRenames().find(key);
      const std::string target = rn != legacyRenames().end() ? rn->second : key;

      if (target == "username")
      {
        // first non-blank account name wins
        if (!value.empty() && out["username"].empty())
          out["username"] = value;
        else
          out.try_emplace("username");
        continue;
      }
      if (target == "enginePath")
      {
        out[target] = value;
        continue;
      }

      // Validate against the current schema; a legacy value that does not parse is unset.
      AnalysisConfig probe;
      if (!applyConfigValue(probe, target, ""))
      {
        std::cerr << "[Preferences] dropping unknown legacy key " << key << "\n";
        continue;
      }
      std::string err;
      if (!applyConfigValue(probe, target, value, &err))
      {
        std::cerr << "[Preferences] dropping legacy value " << key << "=" << raw << " (" << err
                  << ")\n";
        out[target] = "";
        continue;
      }
      out[target] = value;
    }
    out["version"] = std::to_string(PREFERENCES_VERSION);
    return out;
  }

  bool loadPreferences(const fs::path &path, Preferences &out, std::string *err, bool *migrated)
  {
    out = Preferences{};
    if (migrated)
      *migrated = false;

    std::ifstream in(path);
    if (!in.good())
      return true; // first run

    std::map<std::string, std::string> kv;
    std::string line;
    while (std::getline(in, line))
    {
      line = trim(line);
      if (line.empty() || line[0] == '#')
        continue;
      auto eq = line.find('=');
      if (eq == std::string::npos)
        continue;
      kv[trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }

    int version = 0;
    if (auto it = kv.find("version"); it != kv.end())
      version = std::atoi(it->second.c_str());
    if (version > PREFERENCES_VERSION)
    {
      if (err)
        *err = "preferences written by a newer version (" + std::to_string(version) + ")";
      return false;
    }
    if (version < PREFERENCES_VERSION)
    {
      kv = migratePreferences(std::move(kv), version);
      if (migrated)
        *migrated = true;
      std::cerr << "[Preferences] migrated " << path.string() << " from version " << version
                << "\n";
    }

    for (const auto &[k, v] : kv)
    {
      if (k == "version")
        continue;
      if (k == "username")
        out.username = v;
      else if (k == "enginePath")
        out.enginePath = v;
      else if (!applyConfigValue(out.analysis, k, v, err))
      {
        if (err)
          *err = path.string() + ": " + *err;
        return false;
      }
    }
    out.version = PREFERENCES_VERSION;
    return true;
  }

  bool savePreferences(const fs::path &path, const Preferences &prefs, std::string *err)
  {
    std::error_code ec;
    if (path.has_parent_path())
      fs::create_directories(path.parent_path(), ec);

    const fs::path tmp = path.string() + ".tmp";
    {
      std::ofstream out(tmp, std::ios::trunc);
      if (!out.good())
      {
        if (err)
          *err = "cannot write " + tmp.string();
        return false;
      }
      out << "version=" << PREFERENCES_VERSION << "\n";
      out << "username=" << prefs.username << "\n";
      out << "enginePath=" << prefs.enginePath << "\n";
      for (const auto &[k, v] : configValues(prefs.analysis))
        out << k << "=" << v << "\n";
      if (!out.good())
      {
        if (err)
          *err = "write failed: " + tmp.string();
        return false;
      }
    }
    fs::rename(tmp, path, ec);
    if (ec)
    {
      if (err)
        *err = "cannot replace " + path.string() + ": " + ec.message();
      return false;
    }
    return true;
  }

  fs::path userDataDir()
  {
    const char *xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg)
      return fs::path(xdg) / "backranq";
    const char *home = std::getenv("HOME");
    fs::path h = home ? fs::path(home) : fs::temp_directory_path();
    return h / ".local" / "share" / "backranq";
  }

} // namespace backranq::config
