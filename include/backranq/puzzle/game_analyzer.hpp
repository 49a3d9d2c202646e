#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "backranq/config/analysis_config.hpp"
#include "backranq/engine/evaluation_adapter.hpp"
#include "backranq/model/analysis/game_record.hpp"
#include "backranq/puzzle/move_classifier.hpp"

namespace backranq::puzzle
{
  // The game as a whole could not be analyzed; nothing downstream should change.
  class AnalysisError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  struct AnalyzedGame
  {
    model::analysis::GameRecord record;
    EvalTable evals; // one slot per position
    ClassifiedGame classified;
    int evaluatedPositions{0};
    int failedPositions{0};
  };

  // Replays a game and evaluates every position from the first one that can matter
  // (openingSkipPlies) to the end. Checkmate and stalemate are scored locally.
  class GameAnalyzer
  {
  public:
    using ProgressFn = std::function<void(int position, int positionCount)>;

    GameAnalyzer(engine::EvaluationAdapter &adapter, config::ResolvedConfig cfg,
                 std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    void setProgress(ProgressFn fn) { m_progress = std::move(fn); }

    // Throws AnalysisError when the engine is unavailable or no position could be evaluated.
    AnalyzedGame analyze(const model::analysis::GameRecord &rec);
    AnalyzedGame analyzePgn(std::string_view pgn);

    // One position at the given budget; nullopt (with 'err') on failure.
    std::optional<engine::PlyEvaluation> evaluatePosition(const std::string &fen, int ply,
                                                          int movetimeMs,
                                                          std::string *err = nullptr);

    const config::ResolvedConfig &config() const { return m_cfg; }

  private:
    engine::EvaluationAdapter &m_adapter;
    config::ResolvedConfig m_cfg;
    std::chrono::milliseconds m_grace;
    ProgressFn m_progress;
  };

  // A terminal position scored without an engine: mated = mate 0, stalemate = cp 0.
  std::optional<engine::PlyEvaluation> terminalEvaluation(const std::string &fen, int ply);

  // Color whose player tag (White/Black) matches 'username', case-insensitive.
  std::optional<core::Color> playerColor(const model::analysis::GameRecord &rec,
                                         const std::string &username);

} // namespace backranq::puzzle
