#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "backranq/puzzle/attempt_stats.hpp"
#include "backranq/puzzle/puzzle_types.hpp"

namespace backranq::puzzle
{
  class StoreError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  // Milliseconds since the unix epoch; replaceable in tests.
  using ClockFn = std::function<std::int64_t()>;
  std::int64_t systemClockMs();

  struct GameAnalysisInfo
  {
    std::string userId;
    std::string gameId;
    std::int64_t analyzedAtMs{0};
    int puzzleCount{0};
  };

  // Checks a row before it is written; returns false with a reason.
  bool validatePuzzleRow(const Puzzle &p, std::string *why = nullptr);

  // Ids end up in block headers: non-empty, no whitespace, no brackets.
  bool isValidStoreId(const std::string &id);

  class PuzzleRepository
  {
  public:
    virtual ~PuzzleRepository() = default;

    // Deletes every puzzle of (user, game) and inserts 'puzzles' as one unit.
    // Throws StoreError and leaves the previous set in place if any row is invalid
    // or the change cannot be written. An empty list marks the game analyzed with zero puzzles.
    virtual void replaceForGame(const std::string &userId, const std::string &gameId,
                                const std::vector<Puzzle> &puzzles, std::int64_t analyzedAtMs) = 0;

    virtual std::vector<Puzzle> puzzlesForGame(const std::string &userId,
                                               const std::string &gameId) const = 0;
    virtual std::vector<Puzzle> puzzlesForUser(const std::string &userId) const = 0;
    virtual std::optional<Puzzle> findPuzzle(const std::string &puzzleId) const = 0;

    // Absent = never analyzed.
    virtual std::optional<GameAnalysisInfo> gameInfo(const std::string &userId,
                                                     const std::string &gameId) const = 0;

    // Assigns id and store order; returns the stored attempt.
    virtual PuzzleAttempt appendAttempt(PuzzleAttempt attempt) = 0;
    virtual std::vector<PuzzleAttempt> attemptsFor(const std::string &puzzleId,
                                                   const std::string &userId) const = 0;
    virtual std::vector<PuzzleAttempt> attemptsForUser(const std::string &userId) const = 0;
  };

  // Everything a repository holds.
  struct StoreData
  {
    std::map<std::pair<std::string, std::string>, GameAnalysisInfo> games;
    std::map<std::string, Puzzle> puzzles; // by id
    std::vector<PuzzleAttempt> attempts;   // append order
    std::uint64_t nextSeq{1};
  };

  class MemoryPuzzleRepository : public PuzzleRepository
  {
  public:
    MemoryPuzzleRepository() = default;

    void replaceForGame(const std::string &userId, const std::string &gameId,
                        const std::vector<Puzzle> &puzzles, std::int64_t analyzedAtMs) override;

    std::vector<Puzzle> puzzlesForGame(const std::string &userId,
                                       const std::string &gameId) const override;
    std::vector<Puzzle> puzzlesForUser(const std::string &userId) const override;
    std::optional<Puzzle> findPuzzle(const std::string &puzzleId) const override;
    std::optional<GameAnalysisInfo> gameInfo(const std::string &userId,
                                             const std::string &gameId) const override;

    PuzzleAttempt appendAttempt(PuzzleAttempt attempt) override;
    std::vector<PuzzleAttempt> attemptsFor(const std::string &puzzleId,
                                           const std::string &userId) const override;
    std::vector<PuzzleAttempt> attemptsForUser(const std::string &userId) const override;

  protected:
    // Called with the complete next state before it becomes visible; throwing aborts the change.
    virtual void persist(const StoreData &) {}

    mutable std::mutex m_mtx;
    StoreData m_data;
  };

  // MemoryPuzzleRepository backed by one text file of [game ...], [puzzle ...] and
  // [attempt ...] blocks. Writes go to a temporary file renamed over the store.
  class FilePuzzleRepository final : public MemoryPuzzleRepository
  {
  public:
    explicit FilePuzzleRepository(std::filesystem::path path);

    // A missing file is an empty store.
    bool load(std::string *err = nullptr);

    const std::filesystem::path &path() const { return m_path; }

  protected:
    void persist(const StoreData &data) override;

  private:
    std::filesystem::path m_path;
  };

} // namespace backranq::puzzle
