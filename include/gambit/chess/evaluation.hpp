#pragma once

/// @file evaluation.hpp
/// Static chess evaluation: material, piece-square tables and mobility.
///
/// Scores are centipawns from White's point of view, which is the
/// Maximizer's point of view in the chess game adapter.

#include <gambit/chess/position.hpp>

namespace gambit::chess::eval {

/// Centipawn value of a piece type (King 20000, None 0).
[[nodiscard]] int piece_value(PieceType pt) noexcept;

/// Evaluate the position. Positive = White is better.
[[nodiscard]] int evaluate(const Position& pos);

/// White material minus Black material.
[[nodiscard]] int material(const Position& pos) noexcept;

/// Sum of piece-square bonuses, White minus Black, before scaling.
[[nodiscard]] int positional(const Position& pos) noexcept;

/// White legal move count minus Black legal move count.
[[nodiscard]] int mobility(const Position& pos);

/// No queens left, or one queen each with at most two minor pieces in total.
[[nodiscard]] bool is_endgame(const Position& pos) noexcept;

}  // namespace gambit::chess::eval
