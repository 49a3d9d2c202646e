#pragma once

#include <string>
#include <string_view>

namespace backranq::core
{
  const std::string START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

  // Scores beyond this are treated as forced mates when mapped to centipawns.
  constexpr int DEFAULT_MATE_CEILING_CP = 10000;

  // Bounds on what a single game may contribute.
  constexpr int MAX_TAGS_PER_PUZZLE = 64;
  constexpr int MAX_ACCEPTED_MOVES = 16;
  constexpr int OPENING_BOOK_PLIES = 16;

  // ------------------ Version ------------------
  inline constexpr std::string_view BACKRANQ_VERSION{"Backranq 1.0"};
}
