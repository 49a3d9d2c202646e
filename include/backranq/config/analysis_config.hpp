#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "backranq/chess_types.hpp"

namespace backranq::config
{
  enum class PuzzleMode
  {
    AvoidBlunder,
    PunishBlunder,
    Both
  };

  const char *toString(PuzzleMode m);
  std::optional<PuzzleMode> parsePuzzleMode(std::string_view s);

  // Caller-facing analysis settings. Every field may be absent:
  //  - bound fields (evalBandMinCp, evalBandMaxCp, confirmMovetimeMs, uniquenessMarginCp)
  //    are disabled when absent;
  //  - every other field falls back to its documented default.
  struct AnalysisConfig
  {
    std::optional<PuzzleMode> puzzleMode;
    std::optional<int> movetimeMs;
    std::optional<int> maxPuzzlesPerGame; // 0 = unlimited

    std::optional<int> blunderSwingCp;
    std::optional<int> missedTacticSwingCp;
    std::optional<int> missedWinSwingCp;
    std::optional<int> winningThresholdCp;

    std::optional<int> evalBandMinCp;
    std::optional<int> evalBandMaxCp;
    std::optional<int> confirmMovetimeMs;
    std::optional<int> uniquenessMarginCp;

    std::optional<bool> requireTactical;
    std::optional<int> tacticalLookaheadPlies;
    std::optional<bool> skipTrivialEndgames;
    std::optional<int> minNonKingPieces;
    std::optional<int> openingSkipPlies;
    std::optional<int> minPvMoves;
    std::optional<int> cooldownPliesAfterPuzzle;
    std::optional<bool> skipPunishedBlunders;

    std::optional<int> mateCeilingCp;
    std::optional<int> bestMarginCp;
    std::optional<int> inaccuracyCp;

    std::optional<int> multiPv;
    std::optional<int> confirmWorkers;

    // Restricts extraction to puzzles posed to this color.
    std::optional<core::Color> userColor;

    // The preset new users start from: defaults plus the -300..600 eval band.
    static AnalysisConfig defaults();

    // Fields present in 'patch' win.
    AnalysisConfig mergedWith(const AnalysisConfig &patch) const;
  };

  // Fully resolved settings; only bound fields stay optional.
  struct ResolvedConfig
  {
    PuzzleMode puzzleMode{PuzzleMode::Both};
    int movetimeMs{200};
    int maxPuzzlesPerGame{5};

    int blunderSwingCp{250};
    int missedTacticSwingCp{180};
    int missedWinSwingCp{150};
    int winningThresholdCp{200};

    std::optional<int> evalBandMinCp;
    std::optional<int> evalBandMaxCp;
    std::optional<int> confirmMovetimeMs;
    std::optional<int> uniquenessMarginCp;

    bool requireTactical{true};
    int tacticalLookaheadPlies{4};
    bool skipTrivialEndgames{true};
    int minNonKingPieces{4};
    int openingSkipPlies{8};
    int minPvMoves{2};
    int cooldownPliesAfterPuzzle{0};
    bool skipPunishedBlunders{true};

    int mateCeilingCp{10000};
    int bestMarginCp{10};
    int inaccuracyCp{50};

    int multiPv{2};
    int confirmWorkers{2};

    std::optional<core::Color> userColor;

    bool confirmationEnabled() const
    {
      return confirmMovetimeMs && *confirmMovetimeMs > movetimeMs;
    }
  };

  // Applies defaults and clamps out-of-range values; non-positive confirm/uniqueness
  // values disable those stages.
  ResolvedConfig resolve(const AnalysisConfig &cfg);

  // key=value access shared by the preferences file and the command line.
  // An empty value clears the field. Unknown keys and malformed values are errors.
  bool applyConfigValue(AnalysisConfig &cfg, std::string_view key, std::string_view value,
                        std::string *err = nullptr);

  // Every known key with its current value (empty when absent), in a stable order.
  std::vector<std::pair<std::string, std::string>> configValues(const AnalysisConfig &cfg);

  bool parseBool(std::string_view s, bool &out);

} // namespace backranq::config
