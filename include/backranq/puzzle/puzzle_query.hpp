#pragma once
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "backranq/puzzle/puzzle_store.hpp"

namespace backranq::puzzle
{
  constexpr int MAX_FILTER_TAGS = 16;
  constexpr int MAX_FILTER_ECOS = 32;
  constexpr int MAX_PAGE_SIZE = 50;
  constexpr int MAX_NEXT_PUZZLES = 20;
  constexpr int MAX_EXCLUDED_IDS = 200;
  constexpr int MAX_FACETS = 1000;

  // Puzzles with more than one accepted move count as multi-solution.
  enum class SolutionCount
  {
    Any,
    Single,
    Multi
  };

  std::optional<SolutionCount> parseSolutionCount(std::string_view s);

  // Every set field narrows the result.
  struct PuzzleFilter
  {
    std::optional<PuzzleType> type;
    std::optional<Category> category;
    std::optional<Phase> phase;
    std::optional<std::string> gameId;

    std::vector<std::string> openingEcos; // any of these codes
    std::string opening;                  // substring of code, name or variation; unused with openingEcos
    std::vector<std::string> tags;        // all of these
    SolutionCount solutions{SolutionCount::Any};

    // solved: some correct attempt. failed: attempted, never correct. Both: attempted at all.
    bool solved{false};
    bool failed{false};
  };

  // Codes uppercased, lists trimmed of blanks and capped.
  PuzzleFilter normalizeFilter(PuzzleFilter f);

  // 'attempts' are the owner's attempts on this puzzle.
  bool matchesFilter(const Puzzle &p, const PuzzleFilter &f,
                     const std::vector<PuzzleAttempt> &attempts);

  struct PuzzleWithStats
  {
    Puzzle puzzle;
    AttemptStats stats;
  };

  struct PuzzlePage
  {
    std::vector<PuzzleWithStats> puzzles;
    int total{0};
    int page{1};
    int totalPages{1};
  };

  // Most recently analyzed games first, then by ply. 'page' is 1-based; page and
  // limit are clamped to 1..100000 and 1..MAX_PAGE_SIZE.
  PuzzlePage queryPuzzles(const PuzzleRepository &repo, const std::string &userId,
                          const PuzzleFilter &filter, int page = 1, int limit = 20);

  struct NextPuzzleOptions
  {
    int count{1};
    bool preferFailed{false};
    std::vector<std::string> excludeIds;
  };

  // Random picks from the filtered set, drawn bucket by bucket: unattempted, failed, solved
  // (failed first with preferFailed). Order within a bucket is random.
  std::vector<PuzzleWithStats> pickNextPuzzles(const PuzzleRepository &repo,
                                               const std::string &userId,
                                               const PuzzleFilter &filter,
                                               const NextPuzzleOptions &opts, std::mt19937 &rng);

  struct FacetCount
  {
    std::string value;
    std::string label;
    int count{0};
  };

  struct PuzzleFacets
  {
    std::vector<FacetCount> openings; // by ECO code
    std::vector<FacetCount> tags;
  };

  // Counts over all of a user's puzzles, largest first, at most 'limit' of each.
  PuzzleFacets puzzleFacets(const PuzzleRepository &repo, const std::string &userId,
                            int limit = 200);

} // namespace backranq::puzzle
