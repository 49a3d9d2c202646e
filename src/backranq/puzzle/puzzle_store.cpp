#include "backranq/puzzle/puzzle_store.hpp"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

#include "backranq/model/chess_game.hpp"
#include "backranq/model/move.hpp"

namespace backranq::puzzle
{
  namespace fs = std::filesystem;

  static std::string trim(std::string s)
  {
    auto issp = [](unsigned char c)
    { return std::isspace(c); };
    while (!s.empty() && issp((unsigned char)s.front()))
      s.erase(s.begin());
    while (!s.empty() && issp((unsigned char)s.back()))
      s.pop_back();
    return s;
  }

  std::int64_t systemClockMs()
  {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  }

  bool isValidStoreId(const std::string &id)
  {
    if (id.empty())
      return false;
    for (unsigned char c : id)
      if (std::isspace(c) || c == '[' || c == ']' || c == '=')
        return false;
    return true;
  }

  bool validatePuzzleRow(const Puzzle &p, std::string *why)
  {
    auto fail = [&](const char *msg)
    {
      if (why)
        *why = msg;
      return false;
    };
    if (!isValidStoreId(p.id) || !isValidStoreId(p.userId) || !isValidStoreId(p.gameId))
      return fail("bad id");
    if (p.sourcePly < 0)
      return fail("negative sourcePly");
    if (p.fen.empty())
      return fail("empty fen");
    model::ChessGame g;
    if (!g.setPosition(p.fen))
      return fail("invalid fen");
    if (p.bestMoveUci.empty())
      return fail("empty best move");
    const std::string best = model::normalizeUci(p.bestMoveUci);
    if (std::none_of(p.acceptedMovesUci.begin(), p.acceptedMovesUci.end(),
                     [&](const std::string &m)
                     { return model::normalizeUci(m) == best; }))
      return fail("best move not accepted");
    return true;
  }

  // ---------------------------------------------------------------------------
  // MemoryPuzzleRepository
  // ---------------------------------------------------------------------------

  void MemoryPuzzleRepository::replaceForGame(const std::string &userId, const std::string &gameId,
                                              const std::vector<Puzzle> &puzzles,
                                              std::int64_t analyzedAtMs)
  {
    if (!isValidStoreId(userId) || !isValidStoreId(gameId))
      throw StoreError("invalid user or game id");

    std::set<std::string> ids;
    for (const auto &p : puzzles)
    {
      std::string why;
      if (!validatePuzzleRow(p, &why))
        throw StoreError("invalid puzzle row " + p.id + ": " + why);
      if (p.userId != userId || p.gameId != gameId)
        throw StoreError("puzzle " + p.id + " belongs to another game");
      if (!ids.insert(p.id).second)
        throw StoreError("duplicate puzzle id " + p.id);
    }

    std::lock_guard lk(m_mtx);
    StoreData next = m_data;
    for (auto it = next.puzzles.begin(); it != next.puzzles.end();)
    {
      if (it->second.userId == userId && it->second.gameId == gameId)
        it = next.puzzles.erase(it);
      else
        ++it;
    }
    for (const auto &p : puzzles)
    {
      // An id owned by another game is never taken over.
      if (next.puzzles.count(p.id))
        throw StoreError("puzzle id " + p.id + " already used by another game");
      next.puzzles.emplace(p.id, p);
    }
    next.games[{userId, gameId}] = GameAnalysisInfo{userId, gameId, analyzedAtMs, (int)puzzles.size()};

    persist(next);
    m_data = std::move(next);
  }

  std::vector<Puzzle> MemoryPuzzleRepository::puzzlesForGame(const std::string &userId,
                                                             const std::string &gameId) const
  {
    std::lock_guard lk(m_mtx);
    std::vector<Puzzle> out;
    for (const auto &[id, p] : m_data.puzzles)
      if (p.userId == userId && p.gameId == gameId)
        out.push_back(p);
    std::sort(out.begin(), out.end(), [](const Puzzle &a, const Puzzle &b)
              { return a.sourcePly != b.sourcePly ? a.sourcePly < b.sourcePly : a.type < b.type; });
    return out;
  }

  std::vector<Puzzle> MemoryPuzzleRepository::puzzlesForUser(const std::string &userId) const
  {
    std::lock_guard lk(m_mtx);
    std::vector<Puzzle> out;
    for (const auto &[id, p] : m_data.puzzles)
      if (p.userId == userId)
        out.push_back(p);
    return out;
  }

  std::optional<Puzzle> MemoryPuzzleRepository::findPuzzle(const std::string &puzzleId) const
  {
    std::lock_guard lk(m_mtx);
    auto it = m_data.puzzles.find(puzzleId);
    if (it == m_data.puzzles.end())
      return std::nullopt;
    return it->second;
  }

  std::optional<GameAnalysisInfo> MemoryPuzzleRepository::gameInfo(const std::string &userId,
                                                                   const std::string &gameId) const
  {
    std::lock_guard lk(m_mtx);
    auto it = m_data.games.find({userId, gameId});
    if (it == m_data.games.end())
      return std::nullopt;
    return it->second;
  }

  PuzzleAttempt MemoryPuzzleRepository::appendAttempt(PuzzleAttempt attempt)
  {
    if (!isValidStoreId(attempt.puzzleId) || !isValidStoreId(attempt.userId))
      throw StoreError("invalid attempt ids");

    std::lock_guard lk(m_mtx);
    attempt.seq = m_data.nextSeq;
    attempt.id = "a" + std::to_string(attempt.seq);
    m_data.attempts.push_back(attempt);
    ++m_data.nextSeq;

    try
    {
      persist(m_data);
    }
    catch (...)
    {
      // Back to the last written state; the sequence number is reused.
      m_data.attempts.pop_back();
      --m_data.nextSeq;
      throw;
    }
    return attempt;
  }

  std::vector<PuzzleAttempt> MemoryPuzzleRepository::attemptsFor(const std::string &puzzleId,
                                                                 const std::string &userId) const
  {
    std::lock_guard lk(m_mtx);
    std::vector<PuzzleAttempt> out;
    for (const auto &a : m_data.attempts)
      if (a.puzzleId == puzzleId && a.userId == userId)
        out.push_back(a);
    return out;
  }

  std::vector<PuzzleAttempt> MemoryPuzzleRepository::attemptsForUser(const std::string &userId) const
  {
    std::lock_guard lk(m_mtx);
    std::vector<PuzzleAttempt> out;
    for (const auto &a : m_data.attempts)
      if (a.userId == userId)
        out.push_back(a);
    return out;
  }

  // ---------------------------------------------------------------------------
  // FilePuzzleRepository
  // ---------------------------------------------------------------------------

  static std::string oneLine(std::string v)
  {
    std::replace(v.begin(), v.end(), '\n', ' ');
    std::replace(v.begin(), v.end(), '\r', ' ');
    return v;
  }

  static std::string joinWs(const std::vector<std::string> &v)
  {
    std::string out;
    for (const auto &s : v)
    {
      if (!out.empty())
        out.push_back(' ');
      out += s;
    }
    return out;
  }

  static std::vector<std::string> splitWs(const std::string &s)
  {
    std::vector<std::string> out;
    std::istringstream is(s);
    std::string t;
    while (is >> t)
      out.push_back(std::move(t));
    return out;
  }

  static void writePuzzle(std::ostream &out, const Puzzle &p)
  {
    out << "[puzzle " << p.id << "]\n";
    out << "user=" << p.userId << "\n";
    out << "game=" << p.gameId << "\n";
    out << "sourcePly=" << p.sourcePly << "\n";
    out << "fen=" << oneLine(p.fen) << "\n";
    out << "side=" << core::colorChar(p.sideToMove) << "\n";
    out << "type=" << toString(p.type) << "\n";
    out << "category=" << toString(p.category) << "\n";
    out << "phase=" << toString(p.phase) << "\n";
    out << "severity=" << (p.severity ? toString(*p.severity) : "") << "\n";
    out << "score=" << (p.score ? p.score->toString() : std::string{}) << "\n";
    out << "swing=" << p.swingCp << "\n";
    out << "bestMove=" << p.bestMoveUci << "\n";
    out << "bestLine=" << joinWs(p.bestLineUci) << "\n";
    out << "accepted=" << joinWs(p.acceptedMovesUci) << "\n";
    for (const auto &t : p.tags)
      out << "tag=" << oneLine(t) << "\n";
    out << "openingEco=" << oneLine(p.opening.eco.value_or("")) << "\n";
    out << "openingName=" << oneLine(p.opening.name.value_or("")) << "\n";
    out << "openingVariation=" << oneLine(p.opening.variation.value_or("")) << "\n";
    out << "openingSource=" << model::analysis::toString(p.opening.source) << "\n";
    out << "label=" << oneLine(p.label) << "\n";
    out << "\n";
  }

  static void readPuzzleKey(Puzzle &p, const std::string &k, const std::string &v)
  {
    auto opt = [&]() -> std::optional<std::string>
    { return v.empty() ? std::nullopt : std::optional<std::string>(v); };

    if (k == "user")
      p.userId = v;
    else if (k == "game")
      p.gameId = v;
    else if (k == "sourcePly")
      p.sourcePly = std::atoi(v.c_str());
    else if (k == "fen")
      p.fen = v;
    else if (k == "side")
      p.sideToMove = v == "b" ? core::Color::Black : core::Color::White;
    else if (k == "type")
      p.type = parsePuzzleType(v).value_or(PuzzleType::AvoidBlunder);
    else if (k == "category")
      p.category = parseCategory(v).value_or(Category::Blunder);
    else if (k == "phase")
      p.phase = parsePhase(v).value_or(Phase::Middlegame);
    else if (k == "severity")
      p.severity = parseSeverity(v);
    else if (k == "score")
      p.score = engine::Score::parse(v);
    else if (k == "swing")
      p.swingCp = std::atoi(v.c_str());
    else if (k == "bestMove")
      p.bestMoveUci = v;
    else if (k == "bestLine")
      p.bestLineUci = splitWs(v);
    else if (k == "accepted")
      p.acceptedMovesUci = splitWs(v);
    else if (k == "tag")
      p.tags.push_back(v);
    else if (k == "openingEco")
      p.opening.eco = opt();
    else if (k == "openingName")
      p.opening.name = opt();
    else if (k == "openingVariation")
      p.opening.variation = opt();
    else if (k == "openingSource")
    {
      using model::analysis::OpeningSource;
      p.opening.source = v == "pgn"     ? OpeningSource::Pgn
                         : v == "guess" ? OpeningSource::Guess
                                        : OpeningSource::Unknown;
    }
    else if (k == "label")
      p.label = v;
  }

  FilePuzzleRepository::FilePuzzleRepository(fs::path path) : m_path(std::move(path)) {}

  bool FilePuzzleRepository::load(std::string *err)
  {
    std::ifstream in(m_path);
    if (!in.good())
    {
      std::error_code ec;
      if (!fs::exists(m_path, ec))
        return true; // new store
      if (err)
        *err = "cannot open store " + m_path.string();
      return false;
    }

    StoreData data;
    enum class Block
    {
      None,
      Game,
      Puzzle,
      Attempt
    } block = Block::None;

    GameAnalysisInfo game;
    Puzzle puzzle;
    PuzzleAttempt attempt;
    int skipped = 0;

    auto flush = [&]()
    {
      switch (block)
      {
      case Block::Game:
        if (isValidStoreId(game.userId) && isValidStoreId(game.gameId))
          data.games[{game.userId, game.gameId}] = game;
        break;
      case Block::Puzzle:
      {
        std::string why;
        puzzle.motifs = motifsFromTags(puzzle.tags);
        if (validatePuzzleRow(puzzle, &why))
          data.puzzles[puzzle.id] = puzzle;
        else
        {
          ++skipped;
          std::cerr << "[FilePuzzleRepository] skipping puzzle " << puzzle.id << ": " << why
                    << "\n";
        }
        break;
      }
      case Block::Attempt:
        if (isValidStoreId(attempt.puzzleId) && isValidStoreId(attempt.userId))
        {
          data.nextSeq = std::max<std::uint64_t>(data.nextSeq, attempt.seq + 1);
          data.attempts.push_back(attempt);
        }
        break;
      case Block::None:
        break;
      }
      block = Block::None;
      game = GameAnalysisInfo{};
      puzzle = Puzzle{};
      attempt = PuzzleAttempt{};
    };

    auto header = [](const std::string &line, const char *kind, std::string &rest)
    {
      const std::string pfx = std::string("[") + kind + " ";
      if (line.rfind(pfx, 0) != 0 || line.back() != ']')
        return false;
      rest = trim(line.substr(pfx.size(), line.size() - pfx.size() - 1));
      return true;
    };

    std::string line;
    while (std::getline(in, line))
    {
      line = trim(line);
      if (line.empty() || line[0] == '#')
        continue;

      std::string rest;
      if (line.front() == '[')
      {
        flush();
        if (header(line, "game", rest))
        {
          std::istringstream is(rest);
          is >> game.userId >> game.gameId;
          block = Block::Game;
        }
        else if (header(line, "puzzle", rest))
        {
          puzzle.id = rest;
          block = Block::Puzzle;
        }
        else if (header(line, "attempt", rest))
        {
          attempt.id = rest;
          block = Block::Attempt;
        }
        continue;
      }

      auto eq = line.find('=');
      if (eq == std::string::npos || block == Block::None)
        continue;
      const std::string k = trim(line.substr(0, eq));
      const std::string v = trim(line.substr(eq + 1));

      if (block == Block::Game)
      {
        if (k == "analyzedAt")
          game.analyzedAtMs = std::atoll(v.c_str());
        else if (k == "puzzles")
          game.puzzleCount = std::atoi(v.c_str());
      }
      else if (block == Block::Puzzle)
        readPuzzleKey(puzzle, k, v);
      else if (block == Block::Attempt)
      {
        if (k == "puzzle")
          attempt.puzzleId = v;
        else if (k == "user")
          attempt.userId = v;
        else if (k == "move")
          attempt.userMoveUci = v;
        else if (k == "correct")
          attempt.wasCorrect = v == "1";
        else if (k == "timeMs" && !v.empty())
          attempt.timeSpentMs = std::atoi(v.c_str());
        else if (k == "at")
          attempt.attemptedAtMs = std::atoll(v.c_str());
        else if (k == "seq")
          attempt.seq = std::strtoull(v.c_str(), nullptr, 10);
      }
    }
    flush();

    if (skipped > 0)
      std::cerr << "[FilePuzzleRepository] " << skipped << " unreadable puzzle(s) in "
                << m_path.string() << "\n";

    std::lock_guard lk(m_mtx);
    m_data = std::move(data);
    return true;
  }

  void FilePuzzleRepository::persist(const StoreData &data)
  {
    std::error_code ec;
    if (m_path.has_parent_path())
      fs::create_directories(m_path.parent_path(), ec);

    const fs::path tmp = m_path.string() + ".tmp";
    {
      std::ofstream out(tmp, std::ios::trunc);
      if (!out.good())
        throw StoreError("cannot write " + tmp.string());

      out << "# backranq puzzle store\n\n";
      for (const auto &[key, g] : data.games)
      {
        out << "[game " << g.userId << " " << g.gameId << "]\n";
        out << "analyzedAt=" << g.analyzedAtMs << "\n";
        out << "puzzles=" << g.puzzleCount << "\n\n";
      }
      for (const auto &[id, p] : data.puzzles)
        writePuzzle(out, p);
      for (const auto &a : data.attempts)
      {
        out << "[attempt " << a.id << "]\n";
        out << "puzzle=" << a.puzzleId << "\n";
        out << "user=" << a.userId << "\n";
        out << "move=" << oneLine(a.userMoveUci) << "\n";
        out << "correct=" << (a.wasCorrect ? "1" : "0") << "\n";
        if (a.timeSpentMs)
          out << "timeMs=" << *a.timeSpentMs << "\n";
        out << "at=" << a.attemptedAtMs << "\n";
        out << "seq=" << a.seq << "\n\n";
      }

      out.flush();
      if (!out.good())
        throw StoreError("write failed: " + tmp.string());
    }

    fs::rename(tmp, m_path, ec);
    if (ec)
    {
      fs::remove(tmp, ec);
      throw StoreError("cannot replace " + m_path.string());
    }
  }

} // namespace backranq::puzzle
