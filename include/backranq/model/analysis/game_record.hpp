#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../move.hpp"

namespace backranq::model::analysis
{

  struct PlyRecord
  {
    model::Move move;
    std::string san;
    std::string uci;
    std::string fenBefore;
    core::Color mover{core::Color::White};
  };

  struct GameRecord
  {
    std::unordered_map<std::string, std::string> tags;
    std::string startFen;
    std::vector<PlyRecord> plies; // ply order
    std::string finalFen;
    std::string result{"*"}; // "1-0", "0-1", "1/2-1/2", "*"

    // Empty values count as absent.
    std::optional<std::string> tag(const std::string &key) const
    {
      auto it = tags.find(key);
      if (it == tags.end() || it->second.empty())
        return std::nullopt;
      return it->second;
    }

    // Position index i is the position before ply i; index plies.size() is the final position.
    const std::string &fenAt(std::size_t i) const
    {
      return i < plies.size() ? plies[i].fenBefore : finalFen;
    }

    std::size_t positionCount() const { return plies.size() + 1; }
  };

} // namespace backranq::model::analysis
