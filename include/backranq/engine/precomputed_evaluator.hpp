#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "backranq/engine/evaluation_adapter.hpp"

namespace backranq::engine
{
  // Serves evaluations from a table keyed by position (FEN without move clocks).
  // Misses, and entries shallower than the request's minDepth, go to an optional fallback
  // evaluator; completed fallback results are kept so the table can be saved and reused.
  //
  // File format:
  //   [position r1bqkbnr/pppp1ppp/2n5/4p3/4P3/5N2/PPPP1PPP/RNBQKB1R w KQkq - 2 3]
  //   depth=18
  //   line=cp 35 f1b5 a7a6 b5a4
  //   line=cp 20 d2d4 e5d4
  //
  class PrecomputedEvaluator final : public EvaluationAdapter
  {
  public:
    explicit PrecomputedEvaluator(EvaluationAdapter *fallback = nullptr) : m_fallback(fallback) {}

    EvalStreamPtr evaluate(const EvalRequest &req) override;

    void add(const std::string &fen, EvalSnapshot snap);
    bool contains(const std::string &fen) const;
    std::size_t size() const;

    bool loadFromFile(const std::string &path, std::string *err = nullptr);
    bool saveToFile(const std::string &path, std::string *err = nullptr);

    static std::string positionKey(const std::string &fen);

  private:
    void harvestPending();

    EvaluationAdapter *m_fallback;
    mutable std::mutex m_mtx;
    std::unordered_map<std::string, std::pair<std::string, EvalSnapshot>> m_table; // key -> (fen, snapshot)
    std::vector<std::pair<std::string, EvalStreamPtr>> m_pending;                 // fen -> fallback stream
  };

} // namespace backranq::engine
