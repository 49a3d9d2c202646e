#pragma once
#include <optional>
#include <string>
#include <vector>

#include "backranq/model/analysis/game_record.hpp"

namespace backranq::model::analysis
{
  enum class OpeningSource
  {
    Pgn,
    Guess,
    Unknown
  };

  const char *toString(OpeningSource s);

  struct OpeningInfo
  {
    std::optional<std::string> eco;
    std::optional<std::string> name;
    std::optional<std::string> variation;
    OpeningSource source{OpeningSource::Unknown};
  };

  struct OpeningBookEntry
  {
    std::string eco;
    std::string name;
    std::string variation; // empty when the entry names a whole family
    std::vector<std::string> san;
  };

  // Ordered move-prefix book. Order matters only for ties between equally long entries.
  class OpeningBook
  {
  public:
    OpeningBook() = default;
    explicit OpeningBook(std::vector<OpeningBookEntry> entries);

    static const OpeningBook &builtin();

    void add(OpeningBookEntry entry);

    // Appends entries from a TSV file: ECO<TAB>Name<TAB>Variation<TAB>space separated SAN.
    bool loadFromTsvFile(const std::string &path, std::string *err = nullptr);

    // Longest entry whose moves are all a prefix of 'san'; first declared wins a tie.
    const OpeningBookEntry *longestMatch(const std::vector<std::string> &san) const;

    std::size_t size() const { return m_entries.size(); }

  private:
    std::vector<OpeningBookEntry> m_entries;
  };

  // Header tags first (ECO/Opening/Variation), then the book over the first plies.
  OpeningInfo classifyOpening(const GameRecord &rec,
                              const OpeningBook &book = OpeningBook::builtin());

} // namespace backranq::model::analysis
