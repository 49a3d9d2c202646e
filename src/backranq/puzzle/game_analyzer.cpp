#include "backranq/puzzle/game_analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "backranq/model/analysis/pgn_reader.hpp"
#include "backranq/model/chess_game.hpp"

namespace backranq::puzzle
{
  static std::string lowerTrim(std::string s)
  {
    while (!s.empty() && std::isspace((unsigned char)s.front()))
      s.erase(s.begin());
    while (!s.empty() && std::isspace((unsigned char)s.back()))
      s.pop_back();
    for (char &c : s)
      c = (char)std::tolower((unsigned char)c);
    return s;
  }

  std::optional<engine::PlyEvaluation> terminalEvaluation(const std::string &fen, int ply)
  {
    model::ChessGame g;
    if (!g.setPosition(fen))
      return std::nullopt;
    if (!g.generateLegalMoves().empty())
      return std::nullopt;

    engine::PlyEvaluation ev;
    ev.ply = ply;
    ev.fen = fen;
    ev.sideToMove = g.getGameState().sideToMove;
    ev.score = g.inCheck() ? engine::Score::mate(0) : engine::Score::cp(0);
    return ev;
  }

  std::optional<core::Color> playerColor(const model::analysis::GameRecord &rec,
                                         const std::string &username)
  {
    const std::string want = lowerTrim(username);
    if (want.empty())
      return std::nullopt;
    if (auto w = rec.tag("White"); w && lowerTrim(*w) == want)
      return core::Color::White;
    if (auto b = rec.tag("Black"); b && lowerTrim(*b) == want)
      return core::Color::Black;
    return std::nullopt;
  }

  GameAnalyzer::GameAnalyzer(engine::EvaluationAdapter &adapter, config::ResolvedConfig cfg,
                             std::chrono::milliseconds grace)
      : m_adapter(adapter), m_cfg(std::move(cfg)), m_grace(grace)
  {
  }

  std::optional<engine::PlyEvaluation> GameAnalyzer::evaluatePosition(const std::string &fen, int ply,
                                                                      int movetimeMs,
                                                                      std::string *err)
  {
    if (auto t = terminalEvaluation(fen, ply))
      return t;

    model::ChessGame g;
    if (!g.setPosition(fen, err))
      return std::nullopt;

    engine::EvalRequest req;
    req.fen = fen;
    req.multiPv = m_cfg.multiPv;
    req.maxTimeMs = movetimeMs;

    auto snap = engine::evaluateWithBudget(m_adapter, req, m_grace, err);
    if (!snap)
      return std::nullopt;

    engine::PlyEvaluation ev;
    ev.ply = ply;
    ev.fen = fen;
    ev.sideToMove = g.getGameState().sideToMove;
    ev.depth = snap->depth;
    ev.score = snap->lines.front().score;
    ev.lines = std::move(snap->lines);
    return ev;
  }

  AnalyzedGame GameAnalyzer::analyze(const model::analysis::GameRecord &rec)
  {
    AnalyzedGame out;
    out.record = rec;

    const int positions = (int)rec.positionCount();
    out.evals.assign(positions, std::nullopt);

    const int first = std::min(std::max(0, m_cfg.openingSkipPlies), positions - 1);
    int attempted = 0;

    for (int i = first; i < positions; ++i)
    {
      const std::string &fen = rec.fenAt(i);
      std::string err;
      std::optional<engine::PlyEvaluation> ev;
      try
      {
        ev = evaluatePosition(fen, i, m_cfg.movetimeMs, &err);
      }
      catch (const engine::EngineUnavailableError &e)
      {
        throw AnalysisError(std::string("could not analyze: ") + e.what());
      }

      if (!ev || !ev->lines.empty())
        ++attempted; // terminal positions do not need the engine

      if (ev)
      {
        if (!ev->lines.empty())
          ++out.evaluatedPositions;
        out.evals[i] = std::move(ev);
      }
      else
      {
        ++out.failedPositions;
        std::cerr << "[GameAnalyzer] position " << i << " not evaluated: " << err << "\n";
      }

      if (m_progress)
        m_progress(i + 1, positions);
    }

    if (attempted > 0 && out.evaluatedPositions == 0)
      throw AnalysisError("could not analyze: no position could be evaluated");

    out.classified = classifyMoves(out.record, out.evals, m_cfg);
    return out;
  }

  AnalyzedGame GameAnalyzer::analyzePgn(std::string_view pgn)
  {
    model::analysis::GameRecord rec;
    std::string err;
    if (!model::analysis::parsePgnToRecord(pgn, rec, &err))
      throw AnalysisError("could not parse PGN: " + err);
    return analyze(rec);
  }

} // namespace backranq::puzzle
