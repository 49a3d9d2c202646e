#include "backranq/engine/evaluation_adapter.hpp"

namespace backranq::engine
{
  std::optional<EvalSnapshot> evaluateWithBudget(EvaluationAdapter &adapter, const EvalRequest &req,
                                                 std::chrono::milliseconds grace, std::string *err)
  {
    EvalStreamPtr stream = adapter.evaluate(req);
    if (!stream)
    {
      if (err)
        *err = "evaluator returned no stream";
      return std::nullopt;
    }

    const auto budget = std::chrono::milliseconds(req.maxTimeMs.value_or(0)) + grace;
    const auto deadline = std::chrono::steady_clock::now() + budget;
    std::optional<EvalSnapshot> snap = stream->awaitResult(deadline);

    if (!stream->closed())
      stream->cancel();

    if (stream->status() == StreamStatus::Failed && err)
      *err = stream->error();

    if (!snap || snap->lines.empty())
    {
      if (err && err->empty())
        *err = stream->closed() ? "no lines reported" : "timed out without a result";
      return std::nullopt;
    }
    if (req.minDepth && snap->depth < *req.minDepth)
    {
      if (err)
        *err = "depth " + std::to_string(snap->depth) + " below minimum " +
               std::to_string(*req.minDepth);
      return std::nullopt;
    }
    return snap;
  }

  EvalStreamPtr SupersedingEvaluator::evaluate(const EvalRequest &req)
  {
    EvalStreamPtr previous;
    {
      std::lock_guard lk(m_mtx);
      auto it = m_inFlight.find(req.fen);
      if (it != m_inFlight.end())
        previous = it->second.lock();
    }
    if (previous && !previous->closed())
      previous->cancel();

    EvalStreamPtr stream = m_inner.evaluate(req);

    std::lock_guard lk(m_mtx);
    // Drop entries whose streams are gone so the map does not grow with every position.
    for (auto it = m_inFlight.begin(); it != m_inFlight.end();)
    {
      auto s = it->second.lock();
      if (!s || s->closed())
        it = m_inFlight.erase(it);
      else
        ++it;
    }
    m_inFlight[req.fen] = stream;
    return stream;
  }

} // namespace backranq::engine
