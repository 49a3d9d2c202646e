#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "backranq/engine/precomputed_evaluator.hpp"
#include "test_support.hpp"

using namespace backranq;
using namespace backranq::engine;
using backranq::test::line;
using backranq::test::snapshot;
namespace fs = std::filesystem;

namespace
{
  const std::string START = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
  const std::string AFTER_E4 = "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1";

  // Answers every request at once with a fixed line.
  class InstantEvaluator final : public EvaluationAdapter
  {
  public:
    EvalStreamPtr evaluate(const EvalRequest &req) override
    {
      ++calls;
      auto stream = std::make_shared<EvalStream>(1);
      stream->publish(snapshot(12, {line("cp -25", "e7e5 g1f3")}));
      if (req.fen != unfinishedFen)
        stream->finish();
      return stream;
    }

    std::string unfinishedFen;
    int calls{0};
  };

  std::optional<EvalSnapshot> take(EvaluationAdapter &e, const std::string &fen, int multiPv = 1)
  {
    EvalRequest req;
    req.fen = fen;
    req.multiPv = multiPv;
    auto stream = e.evaluate(req);
    return stream->awaitResult(std::chrono::steady_clock::now() + std::chrono::seconds(1));
  }
} // namespace

int main()
{
  const fs::path dir = fs::temp_directory_path() / "backranq_precomputed_test";
  fs::remove_all(dir);
  fs::create_directories(dir);

  // Lookups ignore the move clocks
  {
    PrecomputedEvaluator table;
    table.add(START, snapshot(20, {line("cp 30", "e2e4 e7e5"), line("cp 25", "d2d4 d7d5"),
                                   line("cp 20", "g1f3 g8f6")}));
    assert(table.size() == 1);
    assert(table.contains(START));
    assert(table.contains("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 7 42"));
    assert(!table.contains("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR b KQkq - 0 1"));
    assert(PrecomputedEvaluator::positionKey(START) ==
           "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq -");

    auto one = take(table, START);
    assert(one && one->depth == 20 && one->lines.size() == 1);
    assert(one->lines[0].moveUci == "e2e4");

    auto two = take(table, START, 2);
    assert(two && two->lines.size() == 2 && two->lines[1].moveUci == "d2d4");

    auto all = take(table, START, 8);
    assert(all && all->lines.size() == 3);
  }

  // A miss without fallback fails the stream
  {
    PrecomputedEvaluator table;
    EvalRequest req;
    req.fen = AFTER_E4;
    auto stream = table.evaluate(req);
    assert(stream->status() == StreamStatus::Failed);
    assert(stream->error().find("no precomputed evaluation") != std::string::npos);
    assert(!stream->latest());
  }

  // Misses go to the fallback; finished results are kept on save
  {
    InstantEvaluator engine;
    engine.unfinishedFen = START;
    PrecomputedEvaluator table(&engine);

    auto r = take(table, AFTER_E4);
    assert(r && r->lines[0].moveUci == "e7e5");
    assert(engine.calls == 1);
    assert(!table.contains(AFTER_E4)); // kept only once harvested

    EvalRequest req;
    req.fen = START;
    auto pending = table.evaluate(req);
    assert(pending->status() == StreamStatus::Running);

    const std::string path = (dir / "harvest.evals").string();
    std::string err;
    assert(table.saveToFile(path, &err));
    assert(table.contains(AFTER_E4));
    assert(!table.contains(START));
    pending->cancel();

    take(table, AFTER_E4);
    assert(engine.calls == 2);
  }

  // Entries shallower than the request are misses
  {
    PrecomputedEvaluator table;
    table.add(START, snapshot(12, {line("cp 30", "e2e4 e7e5")}));

    EvalRequest req;
    req.fen = START;
    req.minDepth = 12;
    assert(table.evaluate(req)->status() == StreamStatus::Done);

    req.minDepth = 13;
    auto shallow = table.evaluate(req);
    assert(shallow->status() == StreamStatus::Failed);
    assert(!shallow->latest());

    InstantEvaluator engine;
    PrecomputedEvaluator withEngine(&engine);
    withEngine.add(START, snapshot(12, {line("cp 30", "e2e4 e7e5")}));
    auto viaEngine = withEngine.evaluate(req);
    assert(engine.calls == 1);
    assert(viaEngine->latest() && viaEngine->latest()->lines[0].moveUci == "e7e5");
  }

  // Save and load
  {
    PrecomputedEvaluator table;
    table.add(START, snapshot(18, {line("cp 35", "e2e4 e7e5 g1f3"), line("cp 20", "d2d4")}));
    table.add(AFTER_E4, snapshot(16, {line("mate -3", "f7f6 d1h5")}));

    const std::string path = (dir / "table.evals").string();
    std::string err;
    assert(table.saveToFile(path, &err));
    assert(!fs::exists(path + ".tmp"));

    PrecomputedEvaluator loaded;
    assert(loaded.loadFromFile(path, &err));
    assert(loaded.size() == 2);

    auto s = take(loaded, START, 2);
    assert(s && s->depth == 18 && s->lines.size() == 2);
    assert(s->lines[0].score == Score::cp(35));
    assert((s->lines[0].pvUci == std::vector<std::string>{"e2e4", "e7e5", "g1f3"}));
    auto m = take(loaded, AFTER_E4);
    assert(m && m->lines[0].score == Score::mate(-3));
  }

  // Bad entries are skipped, empty blocks ignored
  {
    const std::string path = (dir / "hand.evals").string();
    {
      std::ofstream out(path);
      out << "# hand written\n"
          << "[position " << START << "]\n"
          << "depth=10\n"
          << "line=cp\n"
          << "line=mate x e2e4\n"
          << "line=cp 12\n"
          << "line=cp 12 e2e4\n\n"
          << "[position " << AFTER_E4 << "]\n"
          << "depth=9\n"
          << "line=nonsense\n";
    }
    PrecomputedEvaluator table;
    std::string err;
    assert(table.loadFromFile(path, &err));
    assert(table.size() == 1);
    auto s = take(table, START);
    assert(s && s->depth == 10 && s->lines.size() == 1);
    assert(s->lines[0].moveUci == "e2e4");
  }

  // Missing file
  {
    PrecomputedEvaluator table;
    std::string err;
    assert(!table.loadFromFile((dir / "absent.evals").string(), &err));
    assert(err.find("absent.evals") != std::string::npos);
  }

  fs::remove_all(dir);
  std::cout << "precomputed_evaluator_test passed\n";
  return 0;
}
