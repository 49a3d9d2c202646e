#include "backranq/config/analysis_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace backranq::config
{
  namespace
  {
    using IntField = std::optional<int> AnalysisConfig::*;
    using BoolField = std::optional<bool> AnalysisConfig::*;

    struct IntKey
    {
      const char *key;
      IntField field;
    };
    struct BoolKey
    {
      const char *key;
      BoolField field;
    };

    constexpr IntKey kIntKeys[] = {
        {"movetimeMs", &AnalysisConfig::movetimeMs},
        {"maxPuzzlesPerGame", &AnalysisConfig::maxPuzzlesPerGame},
        {"blunderSwingCp", &AnalysisConfig::blunderSwingCp},
        {"missedTacticSwingCp", &AnalysisConfig::missedTacticSwingCp},
        {"missedWinSwingCp", &AnalysisConfig::missedWinSwingCp},
        {"winningThresholdCp", &AnalysisConfig::winningThresholdCp},
        {"evalBandMinCp", &AnalysisConfig::evalBandMinCp},
        {"evalBandMaxCp", &AnalysisConfig::evalBandMaxCp},
        {"confirmMovetimeMs", &AnalysisConfig::confirmMovetimeMs},
        {"uniquenessMarginCp", &AnalysisConfig::uniquenessMarginCp},
        {"tacticalLookaheadPlies", &AnalysisConfig::tacticalLookaheadPlies},
        {"minNonKingPieces", &AnalysisConfig::minNonKingPieces},
        {"openingSkipPlies", &AnalysisConfig::openingSkipPlies},
        {"minPvMoves", &AnalysisConfig::minPvMoves},
        {"cooldownPliesAfterPuzzle", &AnalysisConfig::cooldownPliesAfterPuzzle},
        {"mateCeilingCp", &AnalysisConfig::mateCeilingCp},
        {"bestMarginCp", &AnalysisConfig::bestMarginCp},
        {"inaccuracyCp", &AnalysisConfig::inaccuracyCp},
        {"multiPv", &AnalysisConfig::multiPv},
        {"confirmWorkers", &AnalysisConfig::confirmWorkers},
    };

    constexpr BoolKey kBoolKeys[] = {
        {"requireTactical", &AnalysisConfig::requireTactical},
        {"skipTrivialEndgames", &AnalysisConfig::skipTrivialEndgames},
        {"skipPunishedBlunders", &AnalysisConfig::skipPunishedBlunders},
    };

    template <class T>
    void take(std::optional<T> &dst, const std::optional<T> &src)
    {
      if (src)
        dst = src;
    }

    bool parseInt(std::string_view s, int &out)
    {
      if (!s.empty() && s.front() == '+')
        s.remove_prefix(1);
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
      return ec == std::errc{} && ptr == s.data() + s.size();
    }

    std::string lower(std::string_view s)
    {
      std::string out(s);
      for (char &c : out)
        c = (char)std::tolower((unsigned char)c);
      return out;
    }
  } // namespace

  const char *toString(PuzzleMode m)
  {
    switch (m)
    {
    case PuzzleMode::AvoidBlunder:
      return "avoidBlunder";
    case PuzzleMode::PunishBlunder:
      return "punishBlunder";
    case PuzzleMode::Both:
      return "both";
    }
    return "both";
  }

  std::optional<PuzzleMode> parsePuzzleMode(std::string_view s)
  {
    const std::string v = lower(s);
    if (v == "avoidblunder" || v == "avoid")
      return PuzzleMode::AvoidBlunder;
    if (v == "punishblunder" || v == "punish")
      return PuzzleMode::PunishBlunder;
    if (v == "both")
      return PuzzleMode::Both;
    return std::nullopt;
  }

  bool parseBool(std::string_view s, bool &out)
  {
    const std::string v = lower(s);
    if (v == "1" || v == "true" || v == "yes" || v == "on")
      out = true;
    else if (v == "0" || v == "false" || v == "no" || v == "off")
      out = false;
    else
      return false;
    return true;
  }

  AnalysisConfig AnalysisConfig::defaults()
  {
    const ResolvedConfig d{};
    AnalysisConfig c;
    c.puzzleMode = d.puzzleMode;
    c.movetimeMs = d.movetimeMs;
    c.maxPuzzlesPerGame = d.maxPuzzlesPerGame;
    c.blunderSwingCp = d.blunderSwingCp;
    c.missedTacticSwingCp = d.missedTacticSwingCp;
    c.missedWinSwingCp = d.missedWinSwingCp;
    c.winningThresholdCp = d.winningThresholdCp;
    c.evalBandMinCp = -300;
    c.evalBandMaxCp = 600;
    c.requireTactical = d.requireTactical;
    c.tacticalLookaheadPlies = d.tacticalLookaheadPlies;
    c.skipTrivialEndgames = d.skipTrivialEndgames;
    c.minNonKingPieces = d.minNonKingPieces;
    c.openingSkipPlies = d.openingSkipPlies;
    c.minPvMoves = d.minPvMoves;
    return c;
  }

  AnalysisConfig AnalysisConfig::mergedWith(const AnalysisConfig &patch) const
  {
    AnalysisConfig out = *this;
    take(out.puzzleMode, patch.puzzleMode);
    for (const auto &k : kIntKeys)
      take(out.*k.field, patch.*k.field);
    for (const auto &k : kBoolKeys)
      take(out.*k.field, patch.*k.field);
    take(out.userColor, patch.userColor);
    return out;
  }

  ResolvedConfig resolve(const AnalysisConfig &c)
  {
    ResolvedConfig r;
    r.puzzleMode = c.puzzleMode.value_or(r.puzzleMode);
    r.movetimeMs = std::max(1, c.movetimeMs.value_or(r.movetimeMs));
    r.maxPuzzlesPerGame = std::max(0, c.maxPuzzlesPerGame.value_or(r.maxPuzzlesPerGame));

    r.blunderSwingCp = std::max(0, c.blunderSwingCp.value_or(r.blunderSwingCp));
    r.missedTacticSwingCp = std::max(0, c.missedTacticSwingCp.value_or(r.missedTacticSwingCp));
    r.missedWinSwingCp = std::max(0, c.missedWinSwingCp.value_or(r.missedWinSwingCp));
    r.winningThresholdCp = c.winningThresholdCp.value_or(r.winningThresholdCp);

    r.evalBandMinCp = c.evalBandMinCp;
    r.evalBandMaxCp = c.evalBandMaxCp;
    if (c.confirmMovetimeMs && *c.confirmMovetimeMs > 0)
      r.confirmMovetimeMs = c.confirmMovetimeMs;
    if (c.uniquenessMarginCp && *c.uniquenessMarginCp > 0)
      r.uniquenessMarginCp = c.uniquenessMarginCp;

    r.requireTactical = c.requireTactical.value_or(r.requireTactical);
    r.tacticalLookaheadPlies = std::max(1, c.tacticalLookaheadPlies.value_or(r.tacticalLookaheadPlies));
    r.skipTrivialEndgames = c.skipTrivialEndgames.value_or(r.skipTrivialEndgames);
    r.minNonKingPieces = std::max(0, c.minNonKingPieces.value_or(r.minNonKingPieces));
    r.openingSkipPlies = std::max(0, c.openingSkipPlies.value_or(r.openingSkipPlies));
    r.minPvMoves = std::max(0, c.minPvMoves.value_or(r.minPvMoves));
    r.cooldownPliesAfterPuzzle = std::max(0, c.cooldownPliesAfterPuzzle.value_or(r.cooldownPliesAfterPuzzle));
    r.skipPunishedBlunders = c.skipPunishedBlunders.value_or(r.skipPunishedBlunders);

    r.mateCeilingCp = std::max(1, c.mateCeilingCp.value_or(r.mateCeilingCp));
    r.bestMarginCp = std::max(0, c.bestMarginCp.value_or(r.bestMarginCp));
    r.inaccuracyCp = std::max(r.bestMarginCp, c.inaccuracyCp.value_or(r.inaccuracyCp));

    r.multiPv = std::clamp(c.multiPv.value_or(r.multiPv), 1, 16);
    if (r.uniquenessMarginCp)
      r.multiPv = std::max(r.multiPv, 2); // a margin needs a second line
    r.confirmWorkers = std::clamp(c.confirmWorkers.value_or(r.confirmWorkers), 1, 32);

    r.userColor = c.userColor;
    return r;
  }

  bool applyConfigValue(AnalysisConfig &cfg, std::string_view key, std::string_view value,
                        std::string *err)
  {
    auto fail = [&](const std::string &msg)
    {
      if (err)
        *err = msg;
      return false;
    };
    const bool clear = value.empty();

    if (key == "puzzleMode")
    {
      if (clear)
      {
        cfg.puzzleMode.reset();
        return true;
      }
      auto m = parsePuzzleMode(value);
      if (!m)
        return fail("bad puzzleMode: " + std::string(value));
      cfg.puzzleMode = m;
      return true;
    }

    if (key == "userColor")
    {
      const std::string v = lower(value);
      if (clear)
        cfg.userColor.reset();
      else if (v == "white" || v == "w")
        cfg.userColor = core::Color::White;
      else if (v == "black" || v == "b")
        cfg.userColor = core::Color::Black;
      else
        return fail("bad userColor: " + std::string(value));
      return true;
    }

    for (const auto &k : kIntKeys)
    {
      if (key != k.key)
        continue;
      if (clear)
      {
        (cfg.*k.field).reset();
        return true;
      }
      int v = 0;
      if (!parseInt(value, v))
        return fail("bad integer for " + std::string(key) + ": " + std::string(value));
      cfg.*k.field = v;
      return true;
    }

    for (const auto &k : kBoolKeys)
    {
      if (key != k.key)
        continue;
      if (clear)
      {
        (cfg.*k.field).reset();
        return true;
      }
      bool v = false;
      if (!parseBool(value, v))
        return fail("bad boolean for " + std::string(key) + ": " + std::string(value));
      cfg.*k.field = v;
      return true;
    }

    return fail("unknown setting: " + std::string(key));
  }

  std::vector<std::pair<std::string, std::string>> configValues(const AnalysisConfig &cfg)
  {
    std::vector<std::pair<std::string, std::string>> out;
    out.emplace_back("puzzleMode", cfg.puzzleMode ? toString(*cfg.puzzleMode) : "");
    for (const auto &k : kIntKeys)
    {
      const auto &v = cfg.*k.field;
      out.emplace_back(k.key, v ? std::to_string(*v) : "");
    }
    for (const auto &k : kBoolKeys)
    {
      const auto &v = cfg.*k.field;
      out.emplace_back(k.key, v ? (*v ? "true" : "false") : "");
    }
    std::string color;
    if (cfg.userColor)
      color = *cfg.userColor == core::Color::White ? "white" : "black";
    out.emplace_back("userColor", color);
    return out;
  }

} // namespace backranq::config
