#include "backranq/puzzle/sync_coordinator.hpp"

#include <iostream>
#include <set>

namespace backranq::puzzle
{
  SyncCoordinator::SyncCoordinator(PuzzleRepository &repo, ClockFn clock)
      : m_repo(repo), m_clock(clock ? std::move(clock) : ClockFn(systemClockMs))
  {
  }

  SyncCoordinator::GameLock::GameLock(SyncCoordinator &owner, GameKey key)
      : m_owner(owner), m_key(std::move(key))
  {
    {
      std::lock_guard lk(m_owner.m_locksMtx);
      m_slot = &m_owner.m_locks[m_key];
      ++m_slot->users;
    }
    m_slot->mtx.lock();
  }

  SyncCoordinator::GameLock::~GameLock()
  {
    m_slot->mtx.unlock();
    std::lock_guard lk(m_owner.m_locksMtx);
    if (--m_slot->users == 0)
      m_owner.m_locks.erase(m_key);
  }

  std::size_t SyncCoordinator::activeLocks() const
  {
    std::lock_guard lk(m_locksMtx);
    return m_locks.size();
  }

  ReplaceResult SyncCoordinator::replace(const std::string &userId, const std::string &gameId,
                                         const std::vector<PuzzleRecord> &records)
  {
    GameLock lk(*this, {userId, gameId});
    return replaceLocked(userId, gameId, records);
  }

  ReplaceResult SyncCoordinator::replaceLocked(const std::string &userId, const std::string &gameId,
                                               const std::vector<PuzzleRecord> &records)
  {
    ReplaceResult r;
    r.received = (int)records.size();

    std::vector<Puzzle> rows;
    std::set<std::pair<int, PuzzleType>> seen;
    for (const auto &rec : records)
    {
      std::string why;
      auto p = ingestRecord(rec, userId, gameId, &why);
      if (!p)
      {
        ++r.droppedInvalid;
        std::cerr << "[SyncCoordinator] dropped record for " << gameId << ": " << why << "\n";
        continue;
      }
      if (!seen.insert({p->sourcePly, p->type}).second)
      {
        ++r.droppedDuplicate;
        continue;
      }
      rows.push_back(std::move(*p));
    }

    m_repo.replaceForGame(userId, gameId, rows, m_clock());
    r.stored = (int)rows.size();
    return r;
  }

  ExtractReport SyncCoordinator::extractAndReplace(const std::string &userId,
                                                   const std::string &gameId,
                                                   const model::analysis::GameRecord &game,
                                                   GameAnalyzer &analyzer,
                                                   const PuzzleExtractor &extractor,
                                                   const model::analysis::OpeningBook &book)
  {
    GameLock lk(*this, {userId, gameId});

    ExtractReport report;
    report.opening = model::analysis::classifyOpening(game, book);

    AnalyzedGame analyzed = analyzer.analyze(game); // AnalysisError leaves the store alone
    report.classified = analyzed.classified;
    report.failedPositions = analyzed.failedPositions;

    ExtractionInput in;
    in.game = &analyzed;
    in.opening = report.opening;
    in.userId = userId;
    in.gameId = gameId;
    ExtractionResult res = extractor.extract(in);
    report.extraction = res.stats;

    std::vector<PuzzleRecord> records;
    records.reserve(res.puzzles.size());
    for (const auto &p : res.puzzles)
      records.push_back(toRecord(p));

    report.replace = replaceLocked(userId, gameId, records);
    return report;
  }

} // namespace backranq::puzzle
