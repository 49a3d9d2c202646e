#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "backranq/chess_types.hpp"

namespace backranq::engine
{
  // Score from the side to move's point of view, UCI convention.
  // mate N > 0: side to move mates in N; mate N <= 0: side to move is getting mated.
  struct Score
  {
    enum class Kind : std::uint8_t
    {
      Cp,
      Mate
    };

    Kind kind{Kind::Cp};
    int value{0};

    static Score cp(int v) { return Score{Kind::Cp, v}; }
    static Score mate(int n) { return Score{Kind::Mate, n}; }

    [[nodiscard]] bool isMate() const noexcept { return kind == Kind::Mate; }

    // Mate maps to +/-ceiling with sign preserved; plain cp is clamped to the same ceiling.
    [[nodiscard]] int toCp(int ceiling) const noexcept;

    // "cp 35" / "mate -3"
    std::string toString() const;
    static std::optional<Score> parse(std::string_view text);

    friend bool operator==(const Score &a, const Score &b)
    {
      return a.kind == b.kind && a.value == b.value;
    }
  };

  struct EvalLine
  {
    std::string moveUci;
    Score score;
    std::vector<std::string> pvUci;
  };

  // One immutable report from an evaluator: lines ranked best first.
  struct EvalSnapshot
  {
    int depth{0};
    std::vector<EvalLine> lines;
    int timeMs{0};

    const EvalLine *best() const { return lines.empty() ? nullptr : &lines.front(); }
  };

  struct EvalRequest
  {
    std::string fen;
    int multiPv{1};
    std::optional<int> minDepth;
    std::optional<int> maxDepth;
    std::optional<int> maxTimeMs;
  };

  // Evaluation of one game position. 'score' is always set; 'lines' is empty for
  // terminal positions, which are scored without asking an engine.
  struct PlyEvaluation
  {
    int ply{0};
    std::string fen;
    core::Color sideToMove{core::Color::White};
    int depth{0};
    Score score;
    std::vector<EvalLine> lines;

    const EvalLine *best() const { return lines.empty() ? nullptr : &lines.front(); }
    std::string bestMoveUci() const { return lines.empty() ? std::string{} : lines.front().moveUci; }
  };

} // namespace backranq::engine
