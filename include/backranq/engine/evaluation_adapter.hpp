#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "backranq/engine/eval_stream.hpp"
#include "backranq/engine/evaluation.hpp"

namespace backranq::engine
{
  // The evaluator cannot serve requests at all (no engine running, process died).
  class EngineUnavailableError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  class EvaluationAdapter
  {
  public:
    virtual ~EvaluationAdapter() = default;

    // Starts an evaluation and returns its stream immediately.
    // Throws EngineUnavailableError when no evaluation can be started.
    virtual EvalStreamPtr evaluate(const EvalRequest &req) = 0;
  };

  // Runs one request to completion with a hard budget: maxTimeMs plus 'grace'.
  // On timeout the request is cancelled and the best snapshot seen is returned.
  // Returns nullopt when nothing usable arrived; 'err' then says why.
  std::optional<EvalSnapshot> evaluateWithBudget(EvaluationAdapter &adapter, const EvalRequest &req,
                                                 std::chrono::milliseconds grace,
                                                 std::string *err = nullptr);

  // Decorator: a new request for a position that is still being evaluated cancels the older one.
  class SupersedingEvaluator final : public EvaluationAdapter
  {
  public:
    explicit SupersedingEvaluator(EvaluationAdapter &inner) : m_inner(inner) {}

    EvalStreamPtr evaluate(const EvalRequest &req) override;

  private:
    EvaluationAdapter &m_inner;
    std::mutex m_mtx;
    std::unordered_map<std::string, std::weak_ptr<EvalStream>> m_inFlight;
  };

} // namespace backranq::engine
