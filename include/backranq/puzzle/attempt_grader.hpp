#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "backranq/puzzle/attempt_stats.hpp"
#include "backranq/puzzle/puzzle_store.hpp"

namespace backranq::puzzle
{
  enum class AttemptStatus
  {
    Ok,
    BadRequest, // empty move
    NotFound    // no such puzzle for this user
  };

  const char *toString(AttemptStatus s);

  struct AttemptOutcome
  {
    AttemptStatus status{AttemptStatus::Ok};
    std::string error;
    std::optional<PuzzleAttempt> attempt;
    AttemptStats stats; // recomputed after the attempt was stored
  };

  // Grades answers against a puzzle's accepted moves. Correctness is decided here, never
  // taken from the caller.
  class AttemptGrader
  {
  public:
    explicit AttemptGrader(PuzzleRepository &repo, ClockFn clock = systemClockMs);

    AttemptOutcome submit(const std::string &userId, const std::string &puzzleId,
                          std::string_view userMove,
                          std::optional<long long> timeSpentMs = std::nullopt);

    AttemptStats stats(const std::string &userId, const std::string &puzzleId) const;
    UserStats userStats(const std::string &userId) const;

  private:
    PuzzleRepository &m_repo;
    ClockFn m_clock;
  };

} // namespace backranq::puzzle
