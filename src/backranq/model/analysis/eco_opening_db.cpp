#include "backranq/model/analysis/eco_opening_db.hpp"

#include <cctype>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace backranq::model::analysis
{
  namespace
  {
    std::once_flag g_once;
    std::mutex g_mutex;
    std::unordered_map<std::string, std::string> g_map;

    void initBuiltin()
    {
      const std::pair<const char *, const char *> builtin[] = {
          {"A00", "Uncommon Opening"},
          {"A01", "Nimzo-Larsen Attack"},
          {"A02", "Bird's Opening"},
          {"A04", "Reti Opening"},
          {"A10", "English Opening"},
          {"A20", "English Opening: King's English"},
          {"A40", "Queen's Pawn Game"},
          {"A45", "Indian Defense"},
          {"A46", "Indian Defense"},
          {"A48", "London System"},
          {"A56", "Benoni Defense"},
          {"A80", "Dutch Defense"},
          {"B00", "King's Pawn Opening"},
          {"B01", "Scandinavian Defense"},
          {"B02", "Alekhine Defense"},
          {"B06", "Modern Defense"},
          {"B07", "Pirc Defense"},
          {"B10", "Caro-Kann Defense"},
          {"B12", "Caro-Kann Defense: Advance Variation"},
          {"B20", "Sicilian Defense"},
          {"B21", "Sicilian Defense: Smith-Morra Gambit"},
          {"B22", "Sicilian Defense: Alapin Variation"},
          {"B23", "Sicilian Defense: Closed"},
          {"B30", "Sicilian Defense: Old Sicilian"},
          {"B40", "Sicilian Defense: French Variation"},
          {"B50", "Sicilian Defense: Modern Variations"},
          {"B70", "Sicilian Defense: Dragon Variation"},
          {"B90", "Sicilian Defense: Najdorf Variation"},
          {"C00", "French Defense"},
          {"C02", "French Defense: Advance Variation"},
          {"C10", "French Defense: Paulsen Variation"},
          {"C20", "King's Pawn Game"},
          {"C21", "Center Game"},
          {"C23", "Bishop's Opening"},
          {"C25", "Vienna Game"},
          {"C30", "King's Gambit"},
          {"C40", "King's Knight Opening"},
          {"C41", "Philidor Defense"},
          {"C42", "Petrov's Defense"},
          {"C44", "King's Pawn Game: Tayler Opening"},
          {"C45", "Scotch Game"},
          {"C46", "Three Knights Opening"},
          {"C47", "Four Knights Game"},
          {"C50", "Italian Game"},
          {"C54", "Italian Game: Giuoco Piano"},
          {"C55", "Italian Game: Two Knights Defense"},
          {"C60", "Ruy Lopez"},
          {"C65", "Ruy Lopez: Berlin Defense"},
          {"C70", "Ruy Lopez: Morphy Defense"},
          {"D00", "Queen's Pawn Game"},
          {"D02", "Queen's Pawn Game: London System"},
          {"D06", "Queen's Gambit"},
          {"D10", "Slav Defense"},
          {"D20", "Queen's Gambit Accepted"},
          {"D30", "Queen's Gambit Declined"},
          {"D70", "Neo-Gruenfeld Defense"},
          {"D80", "Gruenfeld Defense"},
          {"E00", "Catalan Opening"},
          {"E10", "Indian Defense"},
          {"E12", "Queen's Indian Defense"},
          {"E20", "Nimzo-Indian Defense"},
          {"E60", "King's Indian Defense"},
      };

      for (const auto &kv : builtin)
        g_map.emplace(kv.first, kv.second);
    }

    std::string trimCopy(const std::string &s)
    {
      std::size_t a = 0, b = s.size();
      while (a < b && std::isspace((unsigned char)s[a]))
        ++a;
      while (b > a && std::isspace((unsigned char)s[b - 1]))
        --b;
      return s.substr(a, b - a);
    }
  } // namespace

  std::string EcoOpeningDb::normalizeEco(std::string_view eco)
  {
    // First [A-E][0-9][0-9] run, case-insensitive
    for (std::size_t i = 0; i + 2 < eco.size(); ++i)
    {
      const char a = char(std::toupper((unsigned char)eco[i]));
      if (a >= 'A' && a <= 'E' && std::isdigit((unsigned char)eco[i + 1]) &&
          std::isdigit((unsigned char)eco[i + 2]))
      {
        std::string out{a};
        out.push_back(eco[i + 1]);
        out.push_back(eco[i + 2]);
        return out;
      }
    }
    return {};
  }

  std::string EcoOpeningDb::nameForEco(std::string_view eco)
  {
    std::call_once(g_once, initBuiltin);

    const std::string key = normalizeEco(eco);
    if (key.empty())
      return {};

    std::lock_guard<std::mutex> lk(g_mutex);
    auto it = g_map.find(key);
    return it == g_map.end() ? std::string{} : it->second;
  }

  bool EcoOpeningDb::loadFromTsvFile(const std::string &path)
  {
    std::call_once(g_once, initBuiltin);

    std::ifstream in(path);
    if (!in)
      return false;

    std::string line;
    std::size_t added = 0;

    std::lock_guard<std::mutex> lk(g_mutex);
    while (std::getline(in, line))
    {
      line = trimCopy(line);
      if (line.empty() || line[0] == '#')
        continue;

      const auto tabPos = line.find('\t');
      if (tabPos == std::string::npos)
        continue;

      const std::string eco = normalizeEco(line.substr(0, tabPos));
      const std::string name = trimCopy(line.substr(tabPos + 1));
      if (eco.empty() || name.empty())
        continue;

      g_map[eco] = name;
      ++added;
    }

    return added > 0;
  }

} // namespace backranq::model::analysis
