#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

#include "backranq/model/analysis/san_notation.hpp"
#include "backranq/model/chess_game.hpp"

using namespace backranq;

static bool hasMove(model::ChessGame &game, const std::string &uci)
{
  return game.findLegalMove(uci).has_value();
}

static std::string san(model::ChessGame &game, const std::string &uci)
{
  auto mv = game.findLegalMove(uci);
  assert(mv);
  return model::notation::toSan(game.getPosition(), *mv);
}

int main()
{
  // Start position
  {
    model::ChessGame game;
    assert(game.getFen() == core::START_FEN);
    assert(game.generateLegalMoves().size() == 20);
    assert(!game.inCheck());
  }

  // FEN round trip
  {
    const std::string fens[] = {
        "r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4",
        "8/2P5/8/8/8/8/5k2/K7 w - - 0 60",
        "rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 3",
    };
    for (const auto &fen : fens)
    {
      model::ChessGame game;
      assert(game.setPosition(fen));
      assert(game.getFen() == fen);
    }

    model::ChessGame game;
    std::string err;
    assert(!game.setPosition("8/8/8/8/8/8/8/8 w - - 0 1", &err));
    assert(!err.empty());
    assert(!game.setPosition("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1"));
    assert(!game.setPosition("rnbqkbnr/pppppppp/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1"));
  }

  // En passant and promotion
  {
    model::ChessGame game;
    assert(game.setPosition("rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 3"));
    auto ep = game.findLegalMove("e5f6");
    assert(ep && ep->isEnPassant() && ep->isCapture());
    assert(!hasMove(game, "e5d6"));
    assert(game.doMove(*ep));
    assert(game.getPiece(core::parseSquare("f5")).isNone());
    game.undoMove();
    assert(!game.getPiece(core::parseSquare("f5")).isNone());

    assert(game.setPosition("8/2P5/8/8/8/8/5k2/K7 w - - 0 60"));
    assert(hasMove(game, "c7c8q") && hasMove(game, "c7c8n"));
    assert(!hasMove(game, "c7c8"));
    assert(san(game, "c7c8q") == "c8=Q");
    assert(game.doMoveUCI("C7C8R"));
    assert(game.getPiece(core::parseSquare("c8")).type == core::PieceType::Rook);
  }

  // Castling rules
  {
    model::ChessGame game;
    assert(game.setPosition("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1"));
    assert(hasMove(game, "e1g1") && hasMove(game, "e1c1"));
    assert(san(game, "e1g1") == "O-O");
    assert(san(game, "e1c1") == "O-O-O");

    // Through an attacked square
    assert(game.setPosition("r3k2r/8/8/8/8/8/5r2/R3K2R w KQkq - 0 1"));
    assert(!hasMove(game, "e1g1"));

    // Out of check
    assert(game.setPosition("r3k2r/8/8/8/8/8/8/R3K2R w KQ - 0 1") && !game.inCheck());
    assert(game.setPosition("4r1k1/8/8/8/8/8/8/R3K2R w KQ - 0 1") && game.inCheck());
    assert(!hasMove(game, "e1g1") && !hasMove(game, "e1c1"));

    // Rights disappear once the rook moved
    assert(game.setPosition("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1"));
    assert(game.doMoveUCI("h1h2"));
    assert(game.doMoveUCI("a8a7"));
    assert(game.doMoveUCI("h2h1"));
    assert(game.doMoveUCI("a7a8"));
    assert(!hasMove(game, "e1g1") && hasMove(game, "e1c1"));
  }

  // Pinned pieces and mate detection
  {
    model::ChessGame game;
    assert(game.setPosition("4k3/4r3/8/8/8/8/4B3/4K3 w - - 0 1"));
    assert(!hasMove(game, "e2d3"));
    assert(!game.doMoveUCI("e2d3"));

    assert(game.setPosition("r1bqkb1r/pppp1Qpp/2n2n2/4p3/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 0 4"));
    assert(game.isCheckmate() && !game.isStalemate());

    assert(game.setPosition("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1"));
    assert(game.isStalemate() && !game.isCheckmate());
  }

  // SAN: disambiguation and check marks
  {
    model::ChessGame game;
    assert(game.setPosition("7k/8/8/8/8/8/8/R4R1K w - - 0 1"));
    assert(san(game, "a1d1") == "Rad1");
    assert(san(game, "f1d1") == "Rfd1");
    assert(san(game, "a1a8") == "Ra8+");

    assert(game.setPosition("4k3/8/8/N7/8/N7/8/4K3 w - - 0 1"));
    assert(san(game, "a5b7") == "Nb7");
    assert(san(game, "a3c4") == "N3c4");

    assert(game.setPosition("r1bqkb1r/pppp1ppp/2n2n2/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR w KQkq - 4 4"));
    assert(san(game, "h5f7") == "Qxf7#");

    model::Move mv;
    assert(model::notation::fromSan(game.getPosition(), "Qxf7#", mv));
    assert(model::toUci(mv) == "h5f7");
    assert(model::notation::fromSan(game.getPosition(), "Qxf7", mv));
    assert(!model::notation::fromSan(game.getPosition(), "Qxf8", mv));
    assert(model::notation::normalizeSan("0-0+!?") == "O-O");
  }

  // UCI text helpers
  {
    assert(model::normalizeUci("  E2E4\t") == "e2e4");
    assert(model::normalizeUci("   ").empty());
    core::Square from = 0, to = 0;
    core::PieceType promo = core::PieceType::None;
    assert(model::parseUciCoords("e7e8q", from, to, promo));
    assert(promo == core::PieceType::Queen);
    assert(!model::parseUciCoords("e9e8", from, to, promo));
  }

  std::cout << "move_generator_test passed\n";
  return 0;
}
