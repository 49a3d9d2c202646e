#include "backranq/puzzle/attempt_stats.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

namespace backranq::puzzle
{
  void sortMostRecentFirst(std::vector<PuzzleAttempt> &attempts)
  {
    std::stable_sort(attempts.begin(), attempts.end(),
                     [](const PuzzleAttempt &a, const PuzzleAttempt &b)
                     {
                       if (a.attemptedAtMs != b.attemptedAtMs)
                         return a.attemptedAtMs > b.attemptedAtMs;
                       return a.seq > b.seq;
                     });
  }

  AttemptStats aggregateAttempts(std::vector<PuzzleAttempt> attempts)
  {
    AttemptStats s;
    sortMostRecentFirst(attempts);

    s.attempted = (int)attempts.size();
    long long timeSum = 0;
    int timed = 0;
    for (const auto &a : attempts)
    {
      if (a.wasCorrect)
        ++s.correct;
      if (a.timeSpentMs && *a.timeSpentMs >= 0)
      {
        timeSum += *a.timeSpentMs;
        ++timed;
      }
    }

    s.solved = s.correct > 0;
    s.failed = s.attempted > 0 && s.correct == 0;
    if (s.attempted > 0)
    {
      s.successRate = double(s.correct) / s.attempted;
      s.lastAttemptedAtMs = attempts.front().attemptedAtMs;
      s.lastWasCorrect = attempts.front().wasCorrect;
      s.firstAttemptCorrect = attempts.back().wasCorrect;
    }
    for (const auto &a : attempts)
    {
      if (!a.wasCorrect)
        break;
      ++s.currentStreak;
    }
    if (timed > 0)
      s.averageTimeMs = double(timeSum) / timed;

    s.history = std::move(attempts);
    return s;
  }

  UserStats aggregateUser(const std::vector<Puzzle> &puzzles, std::vector<PuzzleAttempt> attempts)
  {
    UserStats out;
    out.totals.puzzles = (int)puzzles.size();

    std::unordered_map<std::string, const Puzzle *> byId;
    std::map<std::string, int> ecoCounts;
    for (const auto &p : puzzles)
    {
      byId[p.id] = &p;
      ++out.byType[p.type];
      if (p.opening.eco && !p.opening.eco->empty())
        ++ecoCounts[*p.opening.eco];
    }

    std::set<std::string> attempted, solved;
    for (const auto &a : attempts)
    {
      ++out.totals.attempts;
      if (a.wasCorrect)
        ++out.totals.correctAttempts;
      // Attempts on puzzles that are no longer stored still count as attempts.
      if (!byId.count(a.puzzleId))
        continue;
      attempted.insert(a.puzzleId);
      if (a.wasCorrect)
        solved.insert(a.puzzleId);
    }
    out.totals.attemptedPuzzles = (int)attempted.size();
    out.totals.solvedPuzzles = (int)solved.size();
    out.totals.failedPuzzles = std::max(0, out.totals.attemptedPuzzles - out.totals.solvedPuzzles);
    if (out.totals.attempts > 0)
      out.totals.successRate = double(out.totals.correctAttempts) / out.totals.attempts;

    out.topOpenings.assign(ecoCounts.begin(), ecoCounts.end());
    std::stable_sort(out.topOpenings.begin(), out.topOpenings.end(),
                     [](const auto &a, const auto &b)
                     { return a.second > b.second; });
    if ((int)out.topOpenings.size() > TOP_OPENINGS)
      out.topOpenings.resize(TOP_OPENINGS);

    sortMostRecentFirst(attempts);
    if ((int)attempts.size() > RECENT_ATTEMPTS)
      attempts.resize(RECENT_ATTEMPTS);
    out.recentAttempts = std::move(attempts);
    return out;
  }

} // namespace backranq::puzzle
