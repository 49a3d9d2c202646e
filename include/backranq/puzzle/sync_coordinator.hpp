#pragma once
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "backranq/model/analysis/game_record.hpp"
#include "backranq/model/analysis/opening_classifier.hpp"
#include "backranq/puzzle/game_analyzer.hpp"
#include "backranq/puzzle/puzzle_extractor.hpp"
#include "backranq/puzzle/puzzle_record.hpp"
#include "backranq/puzzle/puzzle_store.hpp"

namespace backranq::puzzle
{
  struct ReplaceResult
  {
    int received{0};
    int droppedInvalid{0};
    int droppedDuplicate{0};
    int stored{0};
  };

  struct ExtractReport
  {
    model::analysis::OpeningInfo opening;
    ClassifiedGame classified;
    ExtractionStats extraction;
    ReplaceResult replace;
    int failedPositions{0};
  };

  // Owns the "replace a game's puzzles" operation: ingestion checks, dedup, and one
  // all-or-nothing write per call. Calls for the same (user, game) run one at a time.
  class SyncCoordinator
  {
  public:
    explicit SyncCoordinator(PuzzleRepository &repo, ClockFn clock = systemClockMs);

    // Throws StoreError (from the repository) with the previous puzzles left in place.
    ReplaceResult replace(const std::string &userId, const std::string &gameId,
                          const std::vector<PuzzleRecord> &records);

    // Analyze, extract, replace. Throws AnalysisError before touching the store when the
    // game cannot be analyzed.
    ExtractReport extractAndReplace(const std::string &userId, const std::string &gameId,
                                    const model::analysis::GameRecord &game, GameAnalyzer &analyzer,
                                    const PuzzleExtractor &extractor,
                                    const model::analysis::OpeningBook &book =
                                        model::analysis::OpeningBook::builtin());

    // (user, game) pairs with a call in flight or waiting.
    std::size_t activeLocks() const;

  private:
    using GameKey = std::pair<std::string, std::string>;

    // Entries live only while some call holds or waits for them.
    struct LockSlot
    {
      std::mutex mtx;
      int users{0};
    };

    class GameLock
    {
    public:
      GameLock(SyncCoordinator &owner, GameKey key);
      ~GameLock();
      GameLock(const GameLock &) = delete;
      GameLock &operator=(const GameLock &) = delete;

    private:
      SyncCoordinator &m_owner;
      GameKey m_key;
      LockSlot *m_slot;
    };

    ReplaceResult replaceLocked(const std::string &userId, const std::string &gameId,
                                const std::vector<PuzzleRecord> &records);

    PuzzleRepository &m_repo;
    ClockFn m_clock;

    mutable std::mutex m_locksMtx;
    std::map<GameKey, LockSlot> m_locks;
  };

} // namespace backranq::puzzle
