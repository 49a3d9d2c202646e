#include "backranq/model/analysis/opening_classifier.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

#include "backranq/constants.hpp"
#include "backranq/model/analysis/eco_opening_db.hpp"
#include "backranq/model/analysis/san_notation.hpp"

namespace backranq::model::analysis
{
  namespace
  {
    std::vector<OpeningBookEntry> starterBook()
    {
      // Shorter lines precede longer siblings.
      return {
          {"C20", "King's Pawn Game", "", {"e4", "e5"}},
          {"C40", "King's Knight Opening", "", {"e4", "e5", "Nf3"}},
          {"C50", "Italian Game", "", {"e4", "e5", "Nf3", "Nc6", "Bc4"}},
          {"C54", "Italian Game", "Giuoco Piano", {"e4", "e5", "Nf3", "Nc6", "Bc4", "Bc5"}},
          {"C60", "Ruy Lopez", "", {"e4", "e5", "Nf3", "Nc6", "Bb5"}},
          {"C70", "Ruy Lopez", "Morphy Defense", {"e4", "e5", "Nf3", "Nc6", "Bb5", "a6"}},
          {"B20", "Sicilian Defense", "", {"e4", "c5"}},
          {"C00", "French Defense", "", {"e4", "e6"}},
          {"B10", "Caro-Kann Defense", "", {"e4", "c6"}},
          {"B01", "Scandinavian Defense", "", {"e4", "d5"}},
          {"D00", "Queen's Pawn Game", "", {"d4", "d5"}},
          {"D06", "Queen's Gambit", "", {"d4", "d5", "c4"}},
          {"A40", "Queen's Pawn Game", "English Defense", {"d4", "b6"}},
          {"E60", "King's Indian Defense", "", {"d4", "Nf6", "c4", "g6"}},
          {"E20", "Nimzo-Indian Defense", "", {"d4", "Nf6", "c4", "e6", "Nc3", "Bb4"}},
          {"A10", "English Opening", "", {"c4"}},
      };
    }

    std::optional<std::string> nonEmpty(std::string s)
    {
      if (s.empty())
        return std::nullopt;
      return s;
    }

    std::vector<std::string> splitTabs(const std::string &line)
    {
      std::vector<std::string> out;
      std::size_t start = 0;
      for (;;)
      {
        const std::size_t tab = line.find('\t', start);
        out.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
        if (tab == std::string::npos)
          break;
        start = tab + 1;
      }
      return out;
    }
  } // namespace

  const char *toString(OpeningSource s)
  {
    switch (s)
    {
    case OpeningSource::Pgn:
      return "pgn";
    case OpeningSource::Guess:
      return "guess";
    default:
      return "unknown";
    }
  }

  OpeningBook::OpeningBook(std::vector<OpeningBookEntry> entries) : m_entries(std::move(entries)) {}

  const OpeningBook &OpeningBook::builtin()
  {
    static const OpeningBook book(starterBook());
    return book;
  }

  void OpeningBook::add(OpeningBookEntry entry)
  {
    if (entry.san.empty())
      return;
    for (auto &s : entry.san)
      s = notation::normalizeSan(s);
    m_entries.push_back(std::move(entry));
  }

  bool OpeningBook::loadFromTsvFile(const std::string &path, std::string *err)
  {
    std::ifstream in(path);
    if (!in)
    {
      if (err)
        *err = "Cannot open opening book: " + path;
      return false;
    }

    std::string line;
    int lineNo = 0;
    std::size_t added = 0;
    while (std::getline(in, line))
    {
      ++lineNo;
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      if (line.empty() || line[0] == '#')
        continue;

      const auto cols = splitTabs(line);
      if (cols.size() < 4)
      {
        std::cerr << "[OpeningBook] " << path << ":" << lineNo << " expects 4 columns, skipped\n";
        continue;
      }

      OpeningBookEntry e;
      e.eco = EcoOpeningDb::normalizeEco(cols[0]);
      e.name = cols[1];
      e.variation = cols[2];
      std::istringstream moves(cols[3]);
      std::string san;
      while (moves >> san)
        e.san.push_back(san);

      if (e.eco.empty() || e.name.empty() || e.san.empty())
      {
        std::cerr << "[OpeningBook] " << path << ":" << lineNo << " is incomplete, skipped\n";
        continue;
      }
      add(std::move(e));
      ++added;
    }
    return added > 0;
  }

  const OpeningBookEntry *OpeningBook::longestMatch(const std::vector<std::string> &san) const
  {
    const OpeningBookEntry *best = nullptr;
    for (const auto &entry : m_entries)
    {
      if (entry.san.empty() || entry.san.size() > san.size())
        continue;
      if (!std::equal(entry.san.begin(), entry.san.end(), san.begin()))
        continue;
      if (!best || entry.san.size() > best->san.size())
        best = &entry;
    }
    return best;
  }

  OpeningInfo classifyOpening(const GameRecord &rec, const OpeningBook &book)
  {
    OpeningInfo info;

    // 1) Trust explicit tags verbatim.
    const auto eco = rec.tag("ECO");
    auto name = rec.tag("Opening");
    const auto variation = rec.tag("Variation");
    if (!name && eco)
      name = nonEmpty(EcoOpeningDb::nameForEco(*eco));
    if (eco || name || variation)
    {
      info.eco = eco;
      info.name = name;
      info.variation = variation;
      info.source = OpeningSource::Pgn;
      return info;
    }

    // 2) Guess from the early move sequence; the book only describes the standard start.
    if (rec.startFen != core::START_FEN)
      return info;

    std::vector<std::string> early;
    const std::size_t n = std::min<std::size_t>(rec.plies.size(), core::OPENING_BOOK_PLIES);
    early.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
      early.push_back(notation::normalizeSan(rec.plies[i].san));

    const OpeningBookEntry *match = book.longestMatch(early);
    if (!match)
      return info;

    info.eco = nonEmpty(match->eco);
    info.name = nonEmpty(match->name);
    info.variation = nonEmpty(match->variation);
    info.source = OpeningSource::Guess;
    return info;
  }

} // namespace backranq::model::analysis
