#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "backranq/puzzle/sync_coordinator.hpp"
#include "test_support.hpp"

using namespace backranq;
using puzzle::PuzzleRecord;

namespace
{
  const std::string FEN_W = "r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4";
  const std::string FEN_B = "r1bqkbnr/pppp1ppp/2n5/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 3 3";

  PuzzleRecord record(long long ply, const std::string &fen, const std::string &best,
                      std::vector<std::string> tags = {})
  {
    PuzzleRecord r;
    r.sourcePly = ply;
    r.fen = fen;
    r.bestMoveUci = best;
    r.bestLineUci = std::vector<std::string>{best};
    r.tags = std::move(tags);
    return r;
  }

  // Fails every write while 'failing' is set.
  class FlakyRepository final : public puzzle::MemoryPuzzleRepository
  {
  public:
    bool failing{false};

  protected:
    void persist(const puzzle::StoreData &) override
    {
      if (failing)
        throw puzzle::StoreError("disk full");
    }
  };

  std::int64_t fixedClock() { return 1700000000000LL; }
} // namespace

int main()
{
  // Replace with valid records
  {
    puzzle::MemoryPuzzleRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);
    const auto res = sync.replace("bob", "g1",
                                  {record(6, FEN_W, "H5F7", {"check", "kind:punishBlunder"}),
                                   record(5, FEN_B, "g7g6")});
    assert(res.received == 2);
    assert(res.stored == 2);

    const auto stored = repo.puzzlesForGame("bob", "g1");
    assert(stored.size() == 2);
    assert(stored[0].sourcePly == 5);
    assert(stored[0].type == puzzle::PuzzleType::AvoidBlunder);
    assert(stored[0].id == "bob:g1:5:avoidBlunder");
    assert(stored[1].type == puzzle::PuzzleType::PunishBlunder);
    assert(stored[1].bestMoveUci == "h5f7");
    assert(stored[1].sideToMove == core::Color::White);
    assert((stored[1].tags == std::vector<std::string>{"check", "kind:punishBlunder"}));

    const auto info = repo.gameInfo("bob", "g1");
    assert(info && info->puzzleCount == 2 && info->analyzedAtMs == fixedClock());
  }

  // Replacing again leaves exactly the new set
  {
    puzzle::MemoryPuzzleRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);
    sync.replace("bob", "g1", {record(5, FEN_B, "g7g6"), record(6, FEN_W, "h5f7")});
    sync.replace("bob", "g2", {record(5, FEN_B, "d8e7")});

    auto res = sync.replace("bob", "g1", {record(5, FEN_B, "g7g6"), record(6, FEN_W, "h5f7")});
    assert(res.stored == 2);
    assert(repo.puzzlesForGame("bob", "g1").size() == 2);
    assert(repo.puzzlesForUser("bob").size() == 3);

    // An empty set clears the game and still records the analysis.
    res = sync.replace("bob", "g1", {});
    assert(res.received == 0 && res.stored == 0);
    assert(repo.puzzlesForGame("bob", "g1").empty());
    assert(repo.puzzlesForGame("bob", "g2").size() == 1);
    const auto info = repo.gameInfo("bob", "g1");
    assert(info && info->puzzleCount == 0);
  }

  // Malformed and duplicate records are dropped, the rest is stored
  {
    puzzle::MemoryPuzzleRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);

    PuzzleRecord noTags = record(7, FEN_W, "h5f7");
    noTags.tags.reset();
    PuzzleRecord negative = record(-1, FEN_W, "h5f7");
    PuzzleRecord badFen = record(8, "not a fen", "h5f7");
    PuzzleRecord noBest = record(9, FEN_W, "h5f7");
    noBest.bestMoveUci.reset();
    PuzzleRecord blankBest = record(10, FEN_W, "   ");

    const auto res = sync.replace("bob", "g1",
                                  {record(5, FEN_B, "g7g6"), noTags, negative, badFen, noBest,
                                   blankBest, record(5, FEN_B, "d8e7")});
    assert(res.received == 7);
    assert(res.droppedInvalid == 5);
    assert(res.droppedDuplicate == 1);
    assert(res.stored == 1);
    const auto stored = repo.puzzlesForGame("bob", "g1");
    assert(stored.size() == 1 && stored[0].bestMoveUci == "g7g6");
  }

  // Legacy tags decide type and category
  {
    puzzle::MemoryPuzzleRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);
    sync.replace("bob", "g1",
                 {record(6, FEN_W, "h5f7", {"punishBlunder", "kind:missedWin", "eco:C20", "mateThreat"})});
    const auto p = repo.findPuzzle("bob:g1:6:punishBlunder");
    assert(p);
    assert(p->category == puzzle::Category::MissedWin);
    assert((p->tags == std::vector<std::string>{"kind:punishBlunder", "mateThreat"}));
    assert(p->motifs == std::vector<puzzle::Motif>{puzzle::Motif::MateThreat});
    assert(p->label == "Punish the blunder!");
  }

  // A failed write keeps the previous puzzles
  {
    FlakyRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);
    sync.replace("bob", "g1", {record(5, FEN_B, "g7g6")});

    repo.failing = true;
    bool threw = false;
    try
    {
      sync.replace("bob", "g1", {record(6, FEN_W, "h5f7")});
    }
    catch (const puzzle::StoreError &)
    {
      threw = true;
    }
    assert(threw);
    const auto stored = repo.puzzlesForGame("bob", "g1");
    assert(stored.size() == 1 && stored[0].sourcePly == 5);
    assert(sync.activeLocks() == 0);
  }

  // A failed attempt write stores nothing and reuses the sequence number
  {
    FlakyRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);
    sync.replace("bob", "g1", {record(5, FEN_B, "g7g6")});

    puzzle::PuzzleAttempt a;
    a.puzzleId = "bob:g1:5:avoidBlunder";
    a.userId = "bob";
    a.userMoveUci = "g7g6";
    a.wasCorrect = true;
    const auto first = repo.appendAttempt(a);

    repo.failing = true;
    bool threw = false;
    try
    {
      repo.appendAttempt(a);
    }
    catch (const puzzle::StoreError &)
    {
      threw = true;
    }
    assert(threw);
    assert(repo.attemptsForUser("bob").size() == 1);

    repo.failing = false;
    const auto second = repo.appendAttempt(a);
    assert(second.seq == first.seq + 1);
    assert(second.id == "a" + std::to_string(second.seq));
    const auto stored = repo.attemptsFor(a.puzzleId, "bob");
    assert(stored.size() == 2 && stored.back().id == second.id);
  }

  // Ids that cannot be stored
  {
    puzzle::MemoryPuzzleRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);
    bool threw = false;
    try
    {
      sync.replace("bob smith", "g1", {record(5, FEN_B, "g7g6")});
    }
    catch (const puzzle::StoreError &)
    {
      threw = true;
    }
    assert(threw);
    assert(repo.puzzlesForUser("bob smith").empty());
  }

  // Full pipeline from a game
  {
    const auto rec = test::scholarGame();
    engine::PrecomputedEvaluator table;
    test::addScholarEvals(table, rec);
    const config::ResolvedConfig cfg = config::resolve(test::scholarConfig());
    puzzle::GameAnalyzer analyzer(table, cfg);
    puzzle::PuzzleExtractor extractor(cfg);

    puzzle::MemoryPuzzleRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);
    const auto report = sync.extractAndReplace("bob", "g1", rec, analyzer, extractor);
    assert(report.replace.stored == 2);
    assert(report.opening.source != model::analysis::OpeningSource::Unknown);

    const auto stored = repo.puzzlesForGame("bob", "g1");
    assert(stored.size() == 2);
    assert(stored[0].id == "bob:g1:5:avoidBlunder");
    assert(stored[0].opening.eco == report.opening.eco);

    // Idempotent
    const auto again = sync.extractAndReplace("bob", "g1", rec, analyzer, extractor);
    assert(again.replace.stored == 2);
    const auto stored2 = repo.puzzlesForGame("bob", "g1");
    assert(stored2.size() == 2);
    for (std::size_t i = 0; i < stored.size(); ++i)
    {
      assert(stored[i].id == stored2[i].id);
      assert(stored[i].fen == stored2[i].fen);
      assert(stored[i].tags == stored2[i].tags);
      assert(stored[i].acceptedMovesUci == stored2[i].acceptedMovesUci);
    }
  }

  // Analysis failure leaves the store untouched
  {
    const auto rec = test::scholarGame();
    test::UnavailableEvaluator engine;
    const config::ResolvedConfig cfg = config::resolve(test::scholarConfig());
    puzzle::GameAnalyzer analyzer(engine, cfg);
    puzzle::PuzzleExtractor extractor(cfg);

    puzzle::MemoryPuzzleRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);
    sync.replace("bob", "g1", {record(5, FEN_B, "g7g6")});

    bool threw = false;
    try
    {
      sync.extractAndReplace("bob", "g1", rec, analyzer, extractor);
    }
    catch (const puzzle::AnalysisError &)
    {
      threw = true;
    }
    assert(threw);
    assert(engine.calls == 1);
    assert(repo.puzzlesForGame("bob", "g1").size() == 1);
    assert(sync.activeLocks() == 0);
  }

  // Concurrent replaces of one game end with one complete set
  {
    puzzle::MemoryPuzzleRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);
    std::thread a([&]
                  { for (int i = 0; i < 50; ++i) sync.replace("bob", "g1", {record(5, FEN_B, "g7g6")}); });
    std::thread b([&]
                  { for (int i = 0; i < 50; ++i) sync.replace("bob", "g1", {record(5, FEN_B, "g7g6"),
                                                                            record(6, FEN_W, "h5f7")}); });
    a.join();
    b.join();
    const auto n = repo.puzzlesForGame("bob", "g1").size();
    assert(n == 1 || n == 2);
    assert(sync.activeLocks() == 0);
  }

  // Per-game locks are dropped once no call needs them
  {
    puzzle::MemoryPuzzleRepository repo;
    puzzle::SyncCoordinator sync(repo, fixedClock);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t)
      workers.emplace_back([&sync, t]
                           {
                             for (int i = 0; i < 100; ++i)
                               sync.replace("bob", "g" + std::to_string(t * 100 + i), {record(5, FEN_B, "g7g6")}); });
    for (auto &w : workers)
      w.join();
    assert(repo.gameInfo("bob", "g399"));
    assert(sync.activeLocks() == 0);
  }

  std::cout << "sync_coordinator_test passed\n";
  return 0;
}
