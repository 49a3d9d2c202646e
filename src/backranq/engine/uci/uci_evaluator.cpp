#include "backranq/engine/uci/uci_evaluator.hpp"

#include <algorithm>
#include <iostream>
#include <map>

#include "backranq/engine/uci/uci_info.hpp"

namespace backranq::engine::uci
{
  using Clock = std::chrono::steady_clock;
  using namespace std::chrono_literals;

  namespace
  {
    // Lines of one depth keyed by multipv index; only the contiguous prefix 1..k is reported.
    EvalSnapshot toSnapshot(int depth, const std::map<int, InfoLine> &byPv, int multiPv)
    {
      EvalSnapshot snap;
      snap.depth = depth;
      for (int k = 1; k <= multiPv; ++k)
      {
        auto it = byPv.find(k);
        if (it == byPv.end())
          break;
        EvalLine line;
        line.moveUci = it->second.pv.front();
        line.score = *it->second.score;
        line.pvUci = it->second.pv;
        snap.lines.push_back(std::move(line));
        if (it->second.timeMs)
          snap.timeMs = std::max(snap.timeMs, *it->second.timeMs);
      }
      return snap;
    }
  } // namespace

  UciEvaluator::UciEvaluator(UciEvaluatorOptions opts) : m_opts(std::move(opts)) {}

  UciEvaluator::~UciEvaluator()
  {
    shutdown();
  }

  bool UciEvaluator::start(std::string *err)
  {
    if (m_opts.exePath.empty())
    {
      if (err)
        *err = "no engine path configured";
      return false;
    }
    if (!m_proc.start(m_opts.exePath, m_opts.args))
    {
      if (err)
        *err = "cannot start engine: " + m_opts.exePath;
      return false;
    }
    if (!m_proc.uciHandshake(m_id, m_opts.startupTimeout))
    {
      m_proc.stop();
      if (err)
        *err = "engine did not complete the UCI handshake: " + m_opts.exePath;
      return false;
    }

    if (m_opts.threads > 1)
      m_proc.setOption("Threads", std::to_string(m_opts.threads));
    if (m_opts.hashMb > 0)
      m_proc.setOption("Hash", std::to_string(m_opts.hashMb));
    m_proc.newGame();
    if (!m_proc.isReady(m_opts.startupTimeout))
    {
      m_proc.stop();
      if (err)
        *err = "engine not ready after setup: " + m_opts.exePath;
      return false;
    }

    std::cerr << "[UciEvaluator] started " << (m_id.name.empty() ? m_opts.exePath : m_id.name)
              << "\n";

    {
      std::lock_guard lk(m_mtx);
      m_stop = false;
    }
    m_currentMultiPv = 0;
    m_available.store(true);
    m_worker = std::thread([this]
                           { workerLoop(); });
    return true;
  }

  void UciEvaluator::shutdown()
  {
    {
      std::lock_guard lk(m_mtx);
      m_stop = true;
    }
    m_cv.notify_all();
    if (m_worker.joinable())
      m_worker.join();
    m_available.store(false);
    m_proc.stop();
  }

  EvalStreamPtr UciEvaluator::evaluate(const EvalRequest &req)
  {
    if (!m_available.load())
      throw EngineUnavailableError("UCI engine is not running");

    auto stream = std::make_shared<EvalStream>();
    {
      std::lock_guard lk(m_mtx);
      if (m_stop)
        throw EngineUnavailableError("UCI evaluator is shutting down");
      m_jobs.push_back(Job{req, stream});
    }
    m_cv.notify_one();
    return stream;
  }

  void UciEvaluator::markUnavailable(const std::string &why)
  {
    if (m_available.exchange(false))
      std::cerr << "[UciEvaluator] engine unavailable: " << why << "\n";
  }

  void UciEvaluator::workerLoop()
  {
    for (;;)
    {
      Job job;
      {
        std::unique_lock lk(m_mtx);
        m_cv.wait(lk, [&]
                  { return m_stop || !m_jobs.empty(); });
        if (m_stop)
          break;
        job = std::move(m_jobs.front());
        m_jobs.pop_front();
      }

      if (!m_available.load())
        job.stream->fail("UCI engine is not running");
      else
        runJob(job);
    }

    std::deque<Job> rest;
    {
      std::lock_guard lk(m_mtx);
      rest.swap(m_jobs);
    }
    for (auto &j : rest)
      j.stream->fail("UCI evaluator shut down");
  }

  void UciEvaluator::runJob(Job &job)
  {
    EvalStream &out = *job.stream;
    const EvalRequest &req = job.req;

    if (out.cancelled())
    {
      out.finish();
      return;
    }

    const int multiPv = std::max(1, req.multiPv);
    bool sent = true;
    if (multiPv != m_currentMultiPv)
    {
      sent = m_proc.setOption("MultiPV", std::to_string(multiPv));
      m_currentMultiPv = multiPv;
    }
    sent = sent && m_proc.position(req.fen);

    int budgetMs;
    if (req.maxTimeMs)
    {
      budgetMs = std::max(1, *req.maxTimeMs);
      sent = sent && m_proc.goMovetime(budgetMs);
    }
    else if (req.maxDepth)
    {
      budgetMs = 0;
      sent = sent && m_proc.goDepth(std::max(1, *req.maxDepth));
    }
    else
    {
      budgetMs = m_opts.defaultMovetimeMs;
      sent = sent && m_proc.goMovetime(budgetMs);
    }

    if (!sent)
    {
      markUnavailable("write to engine failed");
      out.fail("UCI engine process exited");
      return;
    }

    // Depth-only searches have no natural deadline; they are bounded only by cancel().
    const bool timed = budgetMs > 0;
    auto deadline = Clock::now() + std::chrono::milliseconds(budgetMs) + m_opts.stopTimeout;
    bool stopSent = false;

    int curDepth = -1;
    std::map<int, InfoLine> curLines;
    std::size_t publishedLines = 0;

    auto publishCurrent = [&](bool final)
    {
      if (curDepth < 0 || curLines.empty())
        return;
      EvalSnapshot snap = toSnapshot(curDepth, curLines, multiPv);
      if (snap.lines.empty())
        return;
      // An interrupted last iteration may carry fewer lines than the previous one.
      if (final && snap.lines.size() < publishedLines)
        return;
      publishedLines = snap.lines.size();
      out.publish(std::move(snap));
    };

    for (;;)
    {
      if (out.cancelled() && !stopSent)
      {
        m_proc.stopSearch();
        stopSent = true;
        deadline = Clock::now() + m_opts.stopTimeout;
      }

      if (Clock::now() >= deadline && (timed || stopSent))
      {
        if (!stopSent)
        {
          m_proc.stopSearch();
          stopSent = true;
          deadline = Clock::now() + m_opts.stopTimeout;
          continue;
        }
        // No bestmove even after stop: resynchronize or give the engine up.
        out.fail("engine did not answer stop");
        if (!m_proc.isReady(m_opts.stopTimeout))
          markUnavailable("engine hung");
        return;
      }

      std::string line;
      auto st = m_proc.readLine(line, 25ms);
      if (st == UciEngineProcess::ReadStatus::Timeout)
        continue;
      if (st == UciEngineProcess::ReadStatus::Closed)
      {
        markUnavailable("process exited");
        out.fail("UCI engine process exited");
        return;
      }

      if (auto info = parseInfoLine(line))
      {
        if (!info->isLine())
          continue;
        if (*info->depth > curDepth)
        {
          publishCurrent(false);
          curDepth = *info->depth;
          curLines.clear();
        }
        if (*info->depth == curDepth && info->multipv <= multiPv)
          curLines[info->multipv] = std::move(*info);
        continue;
      }

      if (parseBestMove(line))
      {
        publishCurrent(true);
        out.finish();
        return;
      }
    }
  }

} // namespace backranq::engine::uci
