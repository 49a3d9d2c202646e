#include "backranq/puzzle/attempt_grader.hpp"

#include <algorithm>
#include <climits>

#include "backranq/model/move.hpp"

namespace backranq::puzzle
{
  const char *toString(AttemptStatus s)
  {
    switch (s)
    {
    case AttemptStatus::Ok:
      return "ok";
    case AttemptStatus::BadRequest:
      return "bad request";
    case AttemptStatus::NotFound:
      return "not found";
    }
    return "ok";
  }

  AttemptGrader::AttemptGrader(PuzzleRepository &repo, ClockFn clock)
      : m_repo(repo), m_clock(clock ? std::move(clock) : ClockFn(systemClockMs))
  {
  }

  AttemptOutcome AttemptGrader::submit(const std::string &userId, const std::string &puzzleId,
                                       std::string_view userMove,
                                       std::optional<long long> timeSpentMs)
  {
    AttemptOutcome out;

    const std::string move = model::normalizeUci(userMove);
    if (move.empty())
    {
      out.status = AttemptStatus::BadRequest;
      out.error = "missing move";
      return out;
    }

    auto puzzle = m_repo.findPuzzle(puzzleId);
    if (!puzzle || puzzle->userId != userId)
    {
      out.status = AttemptStatus::NotFound;
      out.error = "puzzle not found";
      return out;
    }

    PuzzleAttempt a;
    a.puzzleId = puzzleId;
    a.userId = userId;
    a.userMoveUci = move;
    a.wasCorrect = puzzle->accepts(move);
    if (timeSpentMs)
      a.timeSpentMs = (int)std::clamp<long long>(*timeSpentMs, 0, INT_MAX);
    a.attemptedAtMs = m_clock();

    out.attempt = m_repo.appendAttempt(std::move(a));
    out.stats = stats(userId, puzzleId);
    return out;
  }

  AttemptStats AttemptGrader::stats(const std::string &userId, const std::string &puzzleId) const
  {
    return aggregateAttempts(m_repo.attemptsFor(puzzleId, userId));
  }

  UserStats AttemptGrader::userStats(const std::string &userId) const
  {
    return aggregateUser(m_repo.puzzlesForUser(userId), m_repo.attemptsForUser(userId));
  }

} // namespace backranq::puzzle
