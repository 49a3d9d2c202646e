#include <cassert>
#include <iostream>
#include <string>

#include "backranq/constants.hpp"
#include "backranq/model/analysis/pgn_reader.hpp"

using namespace backranq;
using model::analysis::GameRecord;
using model::analysis::parsePgnToRecord;

int main()
{
  // Tags, comments, variations and NAGs
  {
    const std::string pgn = R"([Event "Club"]
[White "Alice"]
[Black "Bob"]
[ECO "C50"]
[Result "1-0"]

1. e4 {best by test} e5 2. Nf3 (2. Qh5 Nc6 (2... Qe7) 3. Bc4) 2... Nc6 $1
3. Bc4 ; a line comment 4. d4
Bc5 4.c3 Nf6?! 5. d4 exd4 6. cxd4 Bb4+ 7. Nc3 Nxe4 8. O-O 1-0)";

    GameRecord rec;
    std::string err;
    assert(parsePgnToRecord(pgn, rec, &err));
    assert(err.empty());
    assert(rec.tag("White") == std::optional<std::string>("Alice"));
    assert(rec.tag("ECO") == std::optional<std::string>("C50"));
    assert(!rec.tag("Opening"));
    assert(rec.result == "1-0");
    assert(rec.plies.size() == 15);

    assert(rec.plies[0].uci == "e2e4" && rec.plies[0].san == "e4");
    assert(rec.plies[0].mover == core::Color::White);
    assert(rec.plies[0].fenBefore == core::START_FEN);
    assert(rec.plies[2].san == "Nf3");
    assert(rec.plies[3].san == "Nc6");
    assert(rec.plies[4].san == "Bc4");
    assert(rec.plies[5].san == "Bc5");
    assert(rec.plies[7].san == "Nf6");
    assert(rec.plies[11].san == "Bb4+");
    assert(rec.plies[13].uci == "f6e4" && rec.plies[13].san == "Nxe4");
    assert(rec.plies[14].uci == "e1g1" && rec.plies[14].san == "O-O");
    assert(rec.plies[14].mover == core::Color::White);

    assert(rec.positionCount() == 16);
    assert(rec.fenAt(1) == rec.plies[1].fenBefore);
    assert(rec.fenAt(15) == rec.finalFen);
    assert(rec.finalFen.rfind("r1bqk2r/pppp1ppp/2n5/8/1bBPn3/2N2N2/PP3PPP/R1BQ1RK1 b kq -", 0) == 0);
  }

  // Move numbers glued to moves, black continuation, no result
  {
    GameRecord rec;
    assert(parsePgnToRecord("1.d4 d5 2.c4 2...e6 3.Nc3", rec));
    assert(rec.plies.size() == 5);
    assert(rec.plies[3].uci == "e7e6");
    assert(rec.result == "*");
    assert(rec.startFen == core::START_FEN);
  }

  // Comments inside variations, bare continuations and a comment that never closes
  {
    GameRecord rec;
    assert(parsePgnToRecord("1. e4 (1. d4 {a ) here} d5 (1... Nf6)) ... e5 2. Nf3$14 {x} Nc6 3. Bb5 {open", rec));
    assert(rec.plies.size() == 5);
    assert(rec.plies[1].san == "e5" && rec.plies[2].san == "Nf3");
    assert(rec.plies[4].san == "Bb5");
    assert(rec.result == "*");

    assert(parsePgnToRecord("1.e4 e5 2.Nf3 Nc6 ; Ruy next\n3.Bb5 1/2-1/2 4.Ba4", rec));
    assert(rec.plies.size() == 5);
    assert(rec.result == "1/2-1/2");
  }

  // Games from a set-up position
  {
    const std::string pgn = R"([FEN "4k3/8/8/8/8/8/4P3/4K3 w - - 0 1"]
[SetUp "1"]

1. e4 Kd7 2. e5 *)";
    GameRecord rec;
    assert(parsePgnToRecord(pgn, rec));
    assert(rec.startFen == "4k3/8/8/8/8/8/4P3/4K3 w - - 0 1");
    assert(rec.plies.size() == 3);
    assert(rec.plies[1].mover == core::Color::Black);
  }

  // Errors
  {
    GameRecord rec;
    std::string err;
    assert(!parsePgnToRecord("1. e4 e5 2. Ke3", rec, &err));
    assert(err.find("Ke3") != std::string::npos);

    err.clear();
    assert(!parsePgnToRecord("1. e4 e5 2. Zz9", rec, &err));
    assert(!err.empty());

    err.clear();
    assert(!parsePgnToRecord("[FEN \"8/8/8/8/8/8/8/8 w - - 0 1\"]\n\n1. e4", rec, &err));
    assert(err.find("FEN") != std::string::npos);
  }

  // An empty movetext is a game without moves
  {
    GameRecord rec;
    assert(parsePgnToRecord("[Event \"?\"]\n\n*", rec));
    assert(rec.plies.empty());
    assert(rec.positionCount() == 1);
    assert(rec.fenAt(0) == rec.finalFen);
  }

  std::cout << "pgn_reader_test passed\n";
  return 0;
}
