#pragma once
#include <vector>

#include "board.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace backranq::model {

class Position {
 public:
  Position() = default;

  Board& getBoard() { return m_board; }
  const Board& getBoard() const { return m_board; }
  GameState& getState() { return m_state; }
  const GameState& getState() const { return m_state; }

  // Make/Unmake. doMove() rejects (and reverts) a move that leaves the mover in check.
  bool doMove(const Move& m);
  void undoMove();

  bool inCheck() const;
  bool isKingInCheck(core::Color c) const;

 private:
  Board m_board;
  GameState m_state;
  std::vector<StateInfo> m_history;

  void updateCastlingRights(core::Square from, core::Square to);
};

}  // namespace backranq::model
