#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "backranq/chess_types.hpp"
#include "backranq/engine/evaluation.hpp"
#include "backranq/model/analysis/opening_classifier.hpp"

namespace backranq::puzzle
{
  enum class PuzzleType
  {
    AvoidBlunder, // posed before the mistake, to the player who made it
    PunishBlunder // posed after the mistake, to the opponent
  };

  enum class Category
  {
    Blunder,
    MissedWin,
    MissedTactic
  };

  enum class Severity
  {
    Small,
    Medium,
    Big
  };

  enum class Motif
  {
    Check,
    Capture,
    Promotion,
    MateThreat,
    HangingPiece
  };

  enum class Phase
  {
    Opening,
    Middlegame,
    Endgame
  };

  const char *toString(PuzzleType t);
  const char *toString(Category c);
  const char *toString(Severity s);
  const char *toString(Motif m);
  const char *toString(Phase p);

  std::optional<PuzzleType> parsePuzzleType(std::string_view s);
  std::optional<Category> parseCategory(std::string_view s);
  std::optional<Severity> parseSeverity(std::string_view s);
  std::optional<Motif> parseMotif(std::string_view s);
  std::optional<Phase> parsePhase(std::string_view s);

  // >= 400 big, >= 200 medium, otherwise small.
  Severity severityFromSwing(int swingCp);

  // Endgame by remaining non-pawn material, opening by ply, middlegame otherwise.
  Phase phaseFor(const std::string &fen, int sourcePly);

  const char *labelFor(PuzzleType t);

  // "kind:avoidBlunder"
  std::string kindTag(PuzzleType t);

  // Motif names plus the kind marker, deduplicated, sorted, capped.
  std::vector<std::string> renderTags(const std::vector<Motif> &motifs, PuzzleType t);

  // Normalizes a free tag list: drops empty and legacy marker tags (bare avoidBlunder /
  // punishBlunder, kind:*, eco:*, opening:*, openingVar:*), dedups, adds the kind marker
  // and caps the result at MAX_TAGS_PER_PUZZLE.
  std::vector<std::string> normalizeTags(const std::vector<std::string> &tags, PuzzleType t);

  // Motifs recovered from tag names; unknown tags are ignored.
  std::vector<Motif> motifsFromTags(const std::vector<std::string> &tags);

  struct Puzzle
  {
    // Identity; empty until the puzzle is stored.
    std::string id;
    std::string userId;
    std::string gameId;

    int sourcePly{0};
    std::string fen;
    core::Color sideToMove{core::Color::White};
    PuzzleType type{PuzzleType::AvoidBlunder};
    Category category{Category::Blunder};
    Phase phase{Phase::Middlegame};
    std::optional<Severity> severity;
    std::optional<engine::Score> score; // start position, solver's view
    int swingCp{0};

    std::string bestMoveUci;
    std::vector<std::string> bestLineUci;
    std::vector<std::string> acceptedMovesUci; // always contains bestMoveUci

    std::vector<Motif> motifs;
    std::vector<std::string> tags;
    model::analysis::OpeningInfo opening;
    std::string label;

    bool accepts(std::string_view normalizedUci) const;
  };

  // "<user>:<game>:<ply>:<type>"; stable across re-extraction.
  std::string makePuzzleId(const std::string &userId, const std::string &gameId, int sourcePly,
                           PuzzleType t);

} // namespace backranq::puzzle
