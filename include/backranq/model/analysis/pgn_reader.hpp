#pragma once
#include <string>
#include <string_view>

#include "backranq/model/analysis/game_record.hpp"

namespace backranq::model::analysis
{
  // Parses a single game. Comments, variations and NAGs are dropped; an unparsable
  // or illegal move token fails the whole game.
  bool parsePgnToRecord(std::string_view pgn, GameRecord &out, std::string *err = nullptr);
}
