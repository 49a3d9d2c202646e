#include "backranq/puzzle/puzzle_query.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <unordered_map>

#include "backranq/model/analysis/eco_opening_db.hpp"

namespace backranq::puzzle
{
  namespace
  {
    std::string lower(std::string_view s)
    {
      std::string out(s);
      for (char &c : out)
        c = (char)std::tolower((unsigned char)c);
      return out;
    }

    std::string trim(std::string s)
    {
      auto issp = [](unsigned char c)
      { return std::isspace(c); };
      while (!s.empty() && issp((unsigned char)s.front()))
        s.erase(s.begin());
      while (!s.empty() && issp((unsigned char)s.back()))
        s.pop_back();
      return s;
    }

    bool containsNoCase(const std::optional<std::string> &field, const std::string &needleLower)
    {
      return field && lower(*field).find(needleLower) != std::string::npos;
    }

    std::vector<std::string> cleanList(const std::vector<std::string> &in, std::size_t cap,
                                       bool upper)
    {
      std::vector<std::string> out;
      for (const auto &raw : in)
      {
        std::string v = trim(raw);
        if (v.empty())
          continue;
        if (upper)
          std::transform(v.begin(), v.end(), v.begin(),
                         [](unsigned char c)
                         { return (char)std::toupper(c); });
        if (std::find(out.begin(), out.end(), v) == out.end())
          out.push_back(std::move(v));
        if (out.size() >= cap)
          break;
      }
      return out;
    }

    using AttemptIndex = std::unordered_map<std::string, std::vector<PuzzleAttempt>>;

    AttemptIndex indexAttempts(const PuzzleRepository &repo, const std::string &userId)
    {
      AttemptIndex idx;
      for (auto &a : repo.attemptsForUser(userId))
        idx[a.puzzleId].push_back(std::move(a));
      return idx;
    }

    const std::vector<PuzzleAttempt> &attemptsOf(const AttemptIndex &idx, const std::string &id)
    {
      static const std::vector<PuzzleAttempt> none;
      auto it = idx.find(id);
      return it == idx.end() ? none : it->second;
    }

    // Filtered puzzles of one user, newest analysis first.
    std::vector<Puzzle> filtered(const PuzzleRepository &repo, const std::string &userId,
                                 const PuzzleFilter &f, const AttemptIndex &attempts)
    {
      std::vector<Puzzle> out;
      for (auto &p : repo.puzzlesForUser(userId))
        if (matchesFilter(p, f, attemptsOf(attempts, p.id)))
          out.push_back(std::move(p));

      std::map<std::string, std::int64_t> analyzedAt;
      for (const auto &p : out)
        if (!analyzedAt.count(p.gameId))
        {
          const auto info = repo.gameInfo(userId, p.gameId);
          analyzedAt[p.gameId] = info ? info->analyzedAtMs : 0;
        }

      std::stable_sort(out.begin(), out.end(), [&](const Puzzle &a, const Puzzle &b)
                       {
                         const auto ta = analyzedAt[a.gameId], tb = analyzedAt[b.gameId];
                         if (ta != tb)
                           return ta > tb;
                         if (a.gameId != b.gameId)
                           return a.gameId < b.gameId;
                         if (a.sourcePly != b.sourcePly)
                           return a.sourcePly < b.sourcePly;
                         return a.type < b.type; });
      return out;
    }
  } // namespace

  std::optional<SolutionCount> parseSolutionCount(std::string_view s)
  {
    const std::string v = lower(s);
    if (v == "any" || v.empty())
      return SolutionCount::Any;
    if (v == "single")
      return SolutionCount::Single;
    if (v == "multi")
      return SolutionCount::Multi;
    return std::nullopt;
  }

  PuzzleFilter normalizeFilter(PuzzleFilter f)
  {
    f.openingEcos = cleanList(f.openingEcos, std::size_t(MAX_FILTER_ECOS), true);
    f.tags = cleanList(f.tags, std::size_t(MAX_FILTER_TAGS), false);
    f.opening = trim(f.opening);
    if (f.gameId && trim(*f.gameId).empty())
      f.gameId.reset();
    return f;
  }

  bool matchesFilter(const Puzzle &p, const PuzzleFilter &f,
                     const std::vector<PuzzleAttempt> &attempts)
  {
    if (f.type && p.type != *f.type)
      return false;
    if (f.category && p.category != *f.category)
      return false;
    if (f.phase && p.phase != *f.phase)
      return false;
    if (f.gameId && p.gameId != *f.gameId)
      return false;

    for (const auto &t : f.tags)
      if (std::find(p.tags.begin(), p.tags.end(), t) == p.tags.end())
        return false;

    const bool multi = p.acceptedMovesUci.size() > 1;
    if (f.solutions == SolutionCount::Multi && !multi)
      return false;
    if (f.solutions == SolutionCount::Single && multi)
      return false;

    if (!f.openingEcos.empty())
    {
      const std::string eco = model::analysis::EcoOpeningDb::normalizeEco(p.opening.eco.value_or(""));
      if (std::find(f.openingEcos.begin(), f.openingEcos.end(), eco) == f.openingEcos.end())
        return false;
    }
    else if (!f.opening.empty())
    {
      const std::string needle = lower(f.opening);
      if (!containsNoCase(p.opening.eco, needle) && !containsNoCase(p.opening.name, needle) &&
          !containsNoCase(p.opening.variation, needle))
        return false;
    }

    if (f.solved || f.failed)
    {
      const bool attempted = !attempts.empty();
      const bool solved = std::any_of(attempts.begin(), attempts.end(),
                                      [](const PuzzleAttempt &a)
                                      { return a.wasCorrect; });
      if (f.solved && f.failed)
        return attempted;
      if (f.solved)
        return solved;
      return attempted && !solved;
    }
    return true;
  }

  PuzzlePage queryPuzzles(const PuzzleRepository &repo, const std::string &userId,
                          const PuzzleFilter &filter, int page, int limit)
  {
    PuzzlePage out;
    out.page = std::clamp(page, 1, 100000);
    limit = std::clamp(limit, 1, MAX_PAGE_SIZE);

    const PuzzleFilter f = normalizeFilter(filter);
    const AttemptIndex attempts = indexAttempts(repo, userId);
    std::vector<Puzzle> all = filtered(repo, userId, f, attempts);

    out.total = (int)all.size();
    out.totalPages = std::max(1, (out.total + limit - 1) / limit);

    const std::size_t begin = std::size_t(out.page - 1) * limit;
    for (std::size_t i = begin; i < all.size() && i < begin + limit; ++i)
    {
      PuzzleWithStats row;
      row.stats = aggregateAttempts(attemptsOf(attempts, all[i].id));
      row.puzzle = std::move(all[i]);
      out.puzzles.push_back(std::move(row));
    }
    return out;
  }

  std::vector<PuzzleWithStats> pickNextPuzzles(const PuzzleRepository &repo,
                                               const std::string &userId,
                                               const PuzzleFilter &filter,
                                               const NextPuzzleOptions &opts, std::mt19937 &rng)
  {
    const int count = std::clamp(opts.count, 1, MAX_NEXT_PUZZLES);
    const std::vector<std::string> excluded = cleanList(opts.excludeIds, std::size_t(MAX_EXCLUDED_IDS), false);
    const std::set<std::string> excludedSet(excluded.begin(), excluded.end());

    const PuzzleFilter f = normalizeFilter(filter);
    const AttemptIndex attempts = indexAttempts(repo, userId);

    std::vector<const Puzzle *> unattempted, failed, solved;
    std::vector<Puzzle> pool = filtered(repo, userId, f, attempts);
    for (const auto &p : pool)
    {
      if (excludedSet.count(p.id))
        continue;
      const auto &as = attemptsOf(attempts, p.id);
      if (as.empty())
        unattempted.push_back(&p);
      else if (std::any_of(as.begin(), as.end(), [](const PuzzleAttempt &a)
                           { return a.wasCorrect; }))
        solved.push_back(&p);
      else
        failed.push_back(&p);
    }
    std::shuffle(unattempted.begin(), unattempted.end(), rng);
    std::shuffle(failed.begin(), failed.end(), rng);
    std::shuffle(solved.begin(), solved.end(), rng);

    std::vector<const std::vector<const Puzzle *> *> order;
    if (opts.preferFailed)
      order = {&failed, &unattempted, &solved};
    else
      order = {&unattempted, &failed, &solved};

    std::vector<PuzzleWithStats> out;
    for (const auto *bucket : order)
      for (const Puzzle *p : *bucket)
      {
        if ((int)out.size() >= count)
          return out;
        out.push_back(PuzzleWithStats{*p, aggregateAttempts(attemptsOf(attempts, p->id))});
      }
    return out;
  }

  PuzzleFacets puzzleFacets(const PuzzleRepository &repo, const std::string &userId, int limit)
  {
    limit = std::clamp(limit, 1, MAX_FACETS);

    struct OpeningGroup
    {
      std::string name;
      std::string variation;
      int count{0};
    };
    std::map<std::string, OpeningGroup> openings;
    std::map<std::string, int> tags;

    for (const auto &p : repo.puzzlesForUser(userId))
    {
      const std::string eco = model::analysis::EcoOpeningDb::normalizeEco(p.opening.eco.value_or(""));
      if (!eco.empty())
      {
        OpeningGroup &g = openings[eco];
        ++g.count;
        // Largest value wins, so the label does not depend on store order.
        g.name = std::max(g.name, trim(p.opening.name.value_or("")));
        g.variation = std::max(g.variation, trim(p.opening.variation.value_or("")));
      }
      for (const auto &t : p.tags)
      {
        const std::string tag = trim(t);
        if (!tag.empty())
          ++tags[tag];
      }
    }

    auto byCount = [](const FacetCount &a, const FacetCount &b)
    { return a.count != b.count ? a.count > b.count : a.value < b.value; };

    PuzzleFacets out;
    for (const auto &[eco, g] : openings)
    {
      FacetCount fc;
      fc.value = eco;
      fc.count = g.count;
      const std::string name = !g.name.empty() ? g.name : model::analysis::EcoOpeningDb::nameForEco(eco);
      fc.label = eco;
      if (!name.empty())
        fc.label += " " + name;
      if (!g.variation.empty())
        fc.label += ": " + g.variation;
      out.openings.push_back(std::move(fc));
    }
    for (const auto &[tag, n] : tags)
      out.tags.push_back(FacetCount{tag, tag, n});

    std::sort(out.openings.begin(), out.openings.end(), byCount);
    std::sort(out.tags.begin(), out.tags.end(), byCount);
    if ((int)out.openings.size() > limit)
      out.openings.resize(limit);
    if ((int)out.tags.size() > limit)
      out.tags.resize(limit);
    return out;
  }

} // namespace backranq::puzzle
