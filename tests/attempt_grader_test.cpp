#include <cassert>
#include <iostream>

#include "backranq/puzzle/attempt_grader.hpp"
#include "backranq/puzzle/sync_coordinator.hpp"

using namespace backranq;
using puzzle::AttemptStatus;

namespace
{
  const std::string FEN_W = "r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4";
  const std::string FEN_B = "r1bqkbnr/pppp1ppp/2n5/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 3 3";

  puzzle::PuzzleRecord record(long long ply, const std::string &fen, const std::string &best,
                              std::vector<std::string> accepted = {}, std::string eco = "",
                              std::string type = "avoidBlunder")
  {
    puzzle::PuzzleRecord r;
    r.sourcePly = ply;
    r.fen = fen;
    r.bestMoveUci = best;
    r.bestLineUci = std::vector<std::string>{best};
    r.tags = std::vector<std::string>{};
    r.type = type;
    if (!accepted.empty())
      r.acceptedMovesUci = accepted;
    if (!eco.empty())
      r.openingEco = eco;
    return r;
  }

  // Advances one second per call.
  struct StepClock
  {
    std::int64_t now{1700000000000LL};
    std::int64_t operator()() { return now += 1000; }
  };
} // namespace

int main()
{
  puzzle::MemoryPuzzleRepository repo;
  StepClock clock;
  auto clockFn = [&clock]
  { return clock(); };

  puzzle::SyncCoordinator sync(repo, clockFn);
  sync.replace("bob", "g1", {record(5, FEN_B, "g7g6", {"d8e7"}, "C20"),
                             record(6, FEN_W, "h5f7", {}, "C20", "punishBlunder")});
  sync.replace("alice", "g9", {record(6, FEN_W, "h5f7", {}, "", "punishBlunder")});

  puzzle::AttemptGrader grader(repo, clockFn);
  const std::string avoid = "bob:g1:5:avoidBlunder";
  const std::string punish = "bob:g1:6:punishBlunder";

  // Grading normalizes case and whitespace
  {
    auto res = grader.submit("bob", punish, "  H5F7 \n", 4200);
    assert(res.status == AttemptStatus::Ok);
    assert(res.attempt);
    assert(res.attempt->wasCorrect);
    assert(res.attempt->userMoveUci == "h5f7");
    assert(res.attempt->timeSpentMs && *res.attempt->timeSpentMs == 4200);
    assert(!res.attempt->id.empty());
    assert(res.stats.attempted == 1 && res.stats.correct == 1);
    assert(res.stats.solved && !res.stats.failed);
    assert(res.stats.firstAttemptCorrect);

    res = grader.submit("bob", punish, "d2d3");
    assert(res.status == AttemptStatus::Ok);
    assert(!res.attempt->wasCorrect);
    assert(!res.attempt->timeSpentMs);
    assert(res.stats.attempted == 2 && res.stats.correct == 1);
    assert(res.stats.successRate && *res.stats.successRate == 0.5);
    assert(res.stats.lastWasCorrect && !*res.stats.lastWasCorrect);
    assert(res.stats.currentStreak == 0);
    assert(res.stats.history.front().userMoveUci == "d2d3");
    assert(res.stats.averageTimeMs && *res.stats.averageTimeMs == 4200.0);
  }

  // Alternatives within the margin are accepted too
  {
    auto res = grader.submit("bob", avoid, "d8e7");
    assert(res.attempt->wasCorrect);
    res = grader.submit("bob", avoid, "g7g6", -50);
    assert(res.attempt->wasCorrect);
    assert(res.attempt->timeSpentMs && *res.attempt->timeSpentMs == 0);
    assert(res.stats.currentStreak == 2);
    res = grader.submit("bob", avoid, "g8f6");
    assert(!res.attempt->wasCorrect);
  }

  // Same puzzle, same move, same verdict
  {
    const bool first = grader.submit("bob", avoid, "g7g6").attempt->wasCorrect;
    for (int i = 0; i < 5; ++i)
      assert(grader.submit("bob", avoid, "g7g6").attempt->wasCorrect == first);
  }

  // Rejected requests store nothing
  {
    const int before = (int)repo.attemptsForUser("bob").size();

    auto res = grader.submit("bob", punish, "   ");
    assert(res.status == AttemptStatus::BadRequest);
    assert(!res.attempt);

    res = grader.submit("bob", "bob:g1:99:avoidBlunder", "e2e4");
    assert(res.status == AttemptStatus::NotFound);

    // Another user's puzzle looks like a missing one.
    res = grader.submit("bob", "alice:g9:6:punishBlunder", "h5f7");
    assert(res.status == AttemptStatus::NotFound);

    assert((int)repo.attemptsForUser("bob").size() == before);
    assert(repo.attemptsForUser("alice").empty());
  }

  // Per-user totals
  {
    const puzzle::UserStats s = grader.userStats("bob");
    assert(s.totals.puzzles == 2);
    assert(s.totals.attemptedPuzzles == 2);
    assert(s.totals.solvedPuzzles == 2);
    assert(s.totals.failedPuzzles == 0);
    assert(s.totals.attempts == 11);
    assert(s.totals.correctAttempts == 9);
    assert(s.byType.at(puzzle::PuzzleType::AvoidBlunder) == 1);
    assert(s.byType.at(puzzle::PuzzleType::PunishBlunder) == 1);
    assert(s.topOpenings.size() == 1);
    assert(s.topOpenings[0].first == "C20" && s.topOpenings[0].second == 2);
    assert(s.recentAttempts.size() == 11);
    assert(s.recentAttempts.front().attemptedAtMs > s.recentAttempts.back().attemptedAtMs);

    const puzzle::UserStats other = grader.userStats("alice");
    assert(other.totals.puzzles == 1 && other.totals.attempts == 0);
    assert(!other.totals.successRate);
  }

  // Attempts survive a re-extraction that drops their puzzle
  {
    sync.replace("bob", "g1", {record(5, FEN_B, "g7g6")});
    const puzzle::UserStats s = grader.userStats("bob");
    assert(s.totals.puzzles == 1);
    assert(s.totals.attempts == 11);
    assert(s.totals.attemptedPuzzles == 1);
    assert(grader.stats("bob", punish).attempted == 2);
  }

  // Ordering: equal timestamps fall back to store order
  {
    std::vector<puzzle::PuzzleAttempt> as(3);
    for (int i = 0; i < 3; ++i)
    {
      as[i].puzzleId = "p";
      as[i].userId = "u";
      as[i].attemptedAtMs = 1000;
      as[i].seq = (std::uint64_t)i + 1;
      as[i].wasCorrect = i != 0;
    }
    const auto st = puzzle::aggregateAttempts(as);
    assert(st.history.front().seq == 3);
    assert(!st.firstAttemptCorrect);
    assert(st.currentStreak == 2);

    const auto none = puzzle::aggregateAttempts({});
    assert(none.attempted == 0 && !none.successRate && !none.solved && !none.failed);
  }

  std::cout << "attempt_grader_test passed\n";
  return 0;
}
