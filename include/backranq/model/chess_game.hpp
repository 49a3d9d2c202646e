#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../constants.hpp"
#include "move_generator.hpp"
#include "position.hpp"

namespace backranq::model {

class ChessGame {
 public:
  ChessGame();

  // Rejects malformed placement, a missing king or a bad side-to-move field.
  bool setPosition(const std::string& fen, std::string* err = nullptr);
  bool doMove(core::Square from, core::Square to,
              core::PieceType promotion = core::PieceType::None);
  bool doMove(const Move& m);
  bool doMoveUCI(std::string_view uciMove);
  void undoMove();

  bb::Piece getPiece(core::Square sq) const;
  const GameState& getGameState() const;
  const std::vector<Move>& generateLegalMoves();
  std::optional<Move> findLegalMove(std::string_view uciMove);

  bool isKingInCheck(core::Color c) const;
  bool inCheck() const;
  bool isCheckmate();
  bool isStalemate();

  Position& getPosition();
  const Position& getPosition() const;

  std::string getFen() const;

 private:
  MoveGenerator m_move_gen;
  Position m_position;
  std::vector<Move> m_pseudo_moves;
  std::vector<Move> m_legal_moves;
};

}  // namespace backranq::model
