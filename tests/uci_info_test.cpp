#include <cassert>
#include <iostream>

#include "backranq/engine/uci/uci_info.hpp"

using namespace backranq::engine;
using namespace backranq::engine::uci;

int main()
{
  // Typical multipv line
  {
    auto info = parseInfoLine("info depth 18 seldepth 24 multipv 2 score cp -35 nodes 123456 nps 900000 "
                              "hashfull 12 tbhits 0 time 137 pv e7e5 g1f3 b8c6");
    assert(info);
    assert(info->depth == 18);
    assert(info->multipv == 2);
    assert(info->score && *info->score == Score::cp(-35));
    assert(!info->bound);
    assert(info->timeMs == 137);
    assert((info->pv == std::vector<std::string>{"e7e5", "g1f3", "b8c6"}));
    assert(info->isLine());
  }

  // Mate scores, defaults, bounds
  {
    auto info = parseInfoLine("info depth 30 score mate -3 pv e8d8 d1d7");
    assert(info && info->multipv == 1);
    assert(*info->score == Score::mate(-3));
    assert(info->isLine());

    info = parseInfoLine("info depth 12 score cp 40 lowerbound pv e2e4");
    assert(info && info->bound && !info->isLine());

    info = parseInfoLine("info depth 12 currmove e2e4 currmovenumber 1");
    assert(info && !info->isLine());

    info = parseInfoLine("info depth 12 score cp 15");
    assert(info && !info->isLine());

    info = parseInfoLine("  info\tdepth 7 score cp 5 pv d2d4\r");
    assert(info && info->depth == 7 && info->pv.size() == 1 && info->pv[0] == "d2d4");
  }

  // Not evaluation output
  {
    assert(!parseInfoLine("info string NNUE evaluation using nn-1111.nnue"));
    assert(!parseInfoLine("readyok"));
    assert(!parseInfoLine(""));
    assert(!parseInfoLine("information depth 3"));
  }

  // Malformed numbers are dropped, not guessed
  {
    auto info = parseInfoLine("info depth x score cp 1e3 pv e2e4");
    assert(info && !info->depth && !info->score);
  }

  // bestmove
  {
    assert(parseBestMove("bestmove e2e4 ponder e7e5") == std::optional<std::string>("e2e4"));
    assert(parseBestMove("bestmove a7a8q") == std::optional<std::string>("a7a8q"));
    assert(parseBestMove("bestmove (none)") == std::optional<std::string>(""));
    assert(parseBestMove("bestmove 0000") == std::optional<std::string>(""));
    assert(!parseBestMove("info depth 1"));
  }

  // Score text
  {
    assert(Score::parse("cp 35") == std::optional<Score>(Score::cp(35)));
    assert(Score::parse("mate -2") == std::optional<Score>(Score::mate(-2)));
    assert(!Score::parse("pawns 3"));
    assert(Score::mate(-2).toString() == "mate -2");
    assert(Score::mate(0).toCp(10000) == -10000);
    assert(Score::mate(4).toCp(10000) == 10000);
    assert(Score::cp(-20000).toCp(10000) == -10000);
  }

  std::cout << "uci_info_test passed\n";
  return 0;
}
