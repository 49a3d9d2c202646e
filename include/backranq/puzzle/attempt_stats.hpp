#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "backranq/puzzle/puzzle_types.hpp"

namespace backranq::puzzle
{
  // One submitted answer. Never modified after it is stored.
  struct PuzzleAttempt
  {
    std::string id;
    std::string puzzleId;
    std::string userId;
    std::string userMoveUci; // trimmed, lowercase
    bool wasCorrect{false};
    std::optional<int> timeSpentMs;
    std::int64_t attemptedAtMs{0}; // unix epoch
    std::uint64_t seq{0};          // store order, breaks ties between equal timestamps
  };

  struct AttemptStats
  {
    int attempted{0};
    int correct{0};
    std::optional<double> successRate;
    bool solved{false};              // at least one correct attempt
    bool failed{false};              // attempted, never correct
    bool firstAttemptCorrect{false};
    std::optional<std::int64_t> lastAttemptedAtMs;
    std::optional<bool> lastWasCorrect;
    int currentStreak{0};            // consecutive correct answers, most recent first
    std::optional<double> averageTimeMs;
    std::vector<PuzzleAttempt> history; // most recent first
  };

  // Fold over the attempts of one (puzzle, user); input order does not matter.
  AttemptStats aggregateAttempts(std::vector<PuzzleAttempt> attempts);

  struct UserTotals
  {
    int puzzles{0};
    int attemptedPuzzles{0};
    int solvedPuzzles{0};
    int failedPuzzles{0};
    int attempts{0};
    int correctAttempts{0};
    std::optional<double> successRate;
  };

  struct UserStats
  {
    UserTotals totals;
    std::map<PuzzleType, int> byType;
    std::vector<std::pair<std::string, int>> topOpenings; // eco -> puzzles, at most 10
    std::vector<PuzzleAttempt> recentAttempts;            // at most 20, most recent first
  };

  constexpr int TOP_OPENINGS = 10;
  constexpr int RECENT_ATTEMPTS = 20;

  UserStats aggregateUser(const std::vector<Puzzle> &puzzles,
                          std::vector<PuzzleAttempt> attempts);

  // Most recent first: later timestamp, then later store order.
  void sortMostRecentFirst(std::vector<PuzzleAttempt> &attempts);

} // namespace backranq::puzzle
