#pragma once
#include <vector>

#include "board.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace backranq::model {

class MoveGenerator {
 public:
  // Moves that obey piece movement rules; king safety is checked by Position::doMove.
  void generatePseudoLegalMoves(const Board& board, const GameState& st,
                                std::vector<Move>& out) const;

  static bool isSquareAttacked(const Board& board, core::Square sq, core::Color by) noexcept;

 private:
  void genPawnMoves(const Board& board, const GameState& st, core::Square from,
                    std::vector<Move>& out) const;
  void genStepMoves(const Board& board, core::Square from, const int (*deltas)[2], int count,
                    std::vector<Move>& out) const;
  void genSliderMoves(const Board& board, core::Square from, const int (*dirs)[2], int count,
                      std::vector<Move>& out) const;
  void genCastling(const Board& board, const GameState& st, std::vector<Move>& out) const;
};

}  // namespace backranq::model
