#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "backranq/engine/evaluation.hpp"

namespace backranq::engine::uci
{
  // Fields of one "info ..." line that matter for evaluation.
  struct InfoLine
  {
    std::optional<int> depth;
    int multipv{1};
    std::optional<Score> score;
    bool bound{false}; // lowerbound/upperbound: score is not exact
    std::optional<int> timeMs;
    std::vector<std::string> pv;

    // Carries a usable line: exact score and at least one pv move.
    bool isLine() const { return depth && score && !bound && !pv.empty(); }
  };

  // Returns nullopt for anything that is not an info line ("info string ..." included).
  std::optional<InfoLine> parseInfoLine(std::string_view line);

  // "bestmove e2e4 ponder e7e5" -> "e2e4". "(none)"/"0000" -> empty string.
  std::optional<std::string> parseBestMove(std::string_view line);

} // namespace backranq::engine::uci
