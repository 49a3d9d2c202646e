#pragma once
#include <optional>
#include <string>
#include <vector>

#include "backranq/engine/evaluation.hpp"
#include "backranq/puzzle/puzzle_types.hpp"

namespace backranq::puzzle
{
  // A puzzle as it crosses the ingestion boundary. Nothing is trusted: every field may be
  // missing and only sourcePly, fen, bestMoveUci, bestLineUci and tags are required.
  struct PuzzleRecord
  {
    std::optional<long long> sourcePly;
    std::optional<std::string> fen;
    std::optional<std::string> bestMoveUci;
    std::optional<std::vector<std::string>> bestLineUci;
    std::optional<std::vector<std::string>> tags;

    std::optional<std::vector<std::string>> acceptedMovesUci;
    std::optional<std::string> type;     // avoidBlunder | punishBlunder
    std::optional<std::string> category; // blunder | missedWin | missedTactic
    std::optional<std::string> severity;
    std::optional<engine::Score> score;
    std::optional<int> swingCp;
    std::optional<std::string> label;
    std::optional<std::string> openingEco;
    std::optional<std::string> openingName;
    std::optional<std::string> openingVariation;
    std::optional<std::string> openingSource; // pgn | guess | unknown
  };

  PuzzleRecord toRecord(const Puzzle &p);

  // Validates and normalizes one record for (user, game). Returns nullopt with a reason
  // when the record is malformed. The puzzle type comes from 'type', falling back to the
  // legacy punishBlunder tag; legacy kind:<category> tags supply a missing category.
  std::optional<Puzzle> ingestRecord(const PuzzleRecord &rec, const std::string &userId,
                                     const std::string &gameId, std::string *why = nullptr);

} // namespace backranq::puzzle
