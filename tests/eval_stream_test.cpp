#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "backranq/constants.hpp"
#include "backranq/engine/evaluation_adapter.hpp"
#include "backranq/engine/thread_pool.hpp"
#include "test_support.hpp"

using namespace backranq;
using namespace std::chrono_literals;

int main()
{
  // Snapshots arrive in order; the queue keeps the newest when full
  {
    engine::EvalStream s(2);
    for (int d = 1; d <= 4; ++d)
      s.publish(test::snapshot(d, {test::line("cp 10", "e2e4")}));
    auto a = s.next(0ms);
    auto b = s.next(0ms);
    assert(a && a->depth == 3);
    assert(b && b->depth == 4);
    assert(!s.next(0ms));
    assert(s.latest() && s.latest()->depth == 4);

    s.finish();
    assert(s.status() == engine::StreamStatus::Done);
    s.publish(test::snapshot(9, {}));
    assert(s.latest()->depth == 4);
  }

  // Cancelling: the producer sees it and closes as cancelled
  {
    auto s = std::make_shared<engine::EvalStream>();
    std::thread producer([s]
                         {
      int depth = 0;
      while (!s->cancelled())
      {
        s->publish(test::snapshot(++depth, {test::line("cp 5", "d2d4")}));
        std::this_thread::sleep_for(1ms);
      }
      s->finish(); });

    assert(s->next(1000ms));
    s->cancel();
    producer.join();
    assert(s->status() == engine::StreamStatus::Cancelled);
    assert(s->closed());
    assert(s->latest());
  }

  // Failure carries a message
  {
    engine::EvalStream s;
    s.fail("engine crashed");
    s.finish();
    assert(s.status() == engine::StreamStatus::Failed);
    assert(s.error() == "engine crashed");
  }

  // Budgeted evaluation of a silent engine times out and cancels
  {
    test::SilentEvaluator silent;
    engine::EvalRequest req;
    req.fen = core::START_FEN;
    req.maxTimeMs = 20;
    std::string err;
    const auto t0 = std::chrono::steady_clock::now();
    auto snap = engine::evaluateWithBudget(silent, req, 30ms, &err);
    assert(!snap);
    assert(!err.empty());
    assert(std::chrono::steady_clock::now() - t0 >= 50ms);
    assert(silent.last && silent.last->cancelled());
  }

  // Depth floor
  {
    engine::PrecomputedEvaluator table;
    table.add(core::START_FEN, test::snapshot(8, {test::line("cp 20", "e2e4")}));
    engine::EvalRequest req;
    req.fen = core::START_FEN;
    req.minDepth = 10;
    std::string err;
    assert(!engine::evaluateWithBudget(table, req, 100ms, &err));
    assert(err.find("depth") != std::string::npos);

    req.minDepth = 8;
    auto snap = engine::evaluateWithBudget(table, req, 100ms, &err);
    assert(snap && snap->best()->moveUci == "e2e4");
  }

  // A newer request for the same position cancels the older one
  {
    test::SilentEvaluator silent;
    engine::SupersedingEvaluator latestWins(silent);
    engine::EvalRequest req;
    req.fen = core::START_FEN;

    auto first = latestWins.evaluate(req);
    auto second = latestWins.evaluate(req);
    assert(first->cancelled());
    assert(!second->cancelled());

    req.fen = "4k3/8/8/8/8/8/4P3/4K3 w - - 0 1";
    auto other = latestWins.evaluate(req);
    assert(!second->cancelled() && !other->cancelled());
  }

  // Worker pool
  {
    engine::ThreadPool pool(3);
    assert(pool.size() == 3);
    std::vector<std::future<int>> futs;
    for (int i = 0; i < 20; ++i)
      futs.push_back(pool.submit([](int x)
                                 { return x * x; },
                                 i));
    int sum = 0;
    for (auto &f : futs)
      sum += f.get();
    assert(sum == 2470);

    auto boom = pool.submit([]() -> int
                            { throw std::runtime_error("boom"); });
    bool threw = false;
    try
    {
      boom.get();
    }
    catch (const std::runtime_error &)
    {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "eval_stream_test passed\n";
  return 0;
}
