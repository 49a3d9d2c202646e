#pragma once
#include <string>
#include <string_view>

#include "backranq/model/move.hpp"
#include "backranq/model/position.hpp"

namespace backranq::model::notation
{

  std::string toSan(const model::Position &pos, const model::Move &mv);

  // Finds the move corresponding to a SAN token in the given position.
  bool fromSan(const model::Position &pos, std::string_view sanToken, model::Move &out);

  // SAN without check marks or annotation glyphs, castling spelled with 'O'.
  std::string normalizeSan(std::string_view in);

} // namespace backranq::model::notation
