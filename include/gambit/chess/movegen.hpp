#pragma once

/// @file movegen.hpp
/// Pseudo-legal and legal move generation, game status and perft.
///
/// Generation can run for either colour so the evaluator can count
/// mobility for the side not on move. En passant is only generated for
/// the side to move.

#include <gambit/chess/position.hpp>

#include <cstdint>
#include <string_view>

namespace gambit::chess::movegen {

/// Moves for `us` that obey piece movement but may leave the king in check.
[[nodiscard]] MoveList pseudo_legal(const Position& pos, Color us);

[[nodiscard]] inline MoveList pseudo_legal(const Position& pos) {
    return pseudo_legal(pos, pos.side_to_move());
}

/// Does the pseudo-legal move `m` by `us` keep our king out of check?
[[nodiscard]] bool is_legal(const Position& pos, const Move& m, Color us);

/// All strictly legal moves for `us`.
[[nodiscard]] MoveList legal(const Position& pos, Color us);

[[nodiscard]] inline MoveList legal(const Position& pos) {
    return legal(pos, pos.side_to_move());
}

/// Stops at the first legal move found.
[[nodiscard]] bool has_legal_move(const Position& pos);

/// Count leaf nodes at `depth` plies (perft for validation).
[[nodiscard]] std::uint64_t perft(Position& pos, int depth);

// ── Game status ─────────────────────────────────────────────────────────────

enum class GameStatus : std::uint8_t {
    Ongoing,
    Checkmate,  ///< side to move is mated
    Stalemate,
    InsufficientMaterial,
    FiftyMoveRule,
    ThreefoldRepetition,
};

/// Classify `pos`. Mate and stalemate take precedence over the draw rules.
[[nodiscard]] GameStatus status(const Position& pos);

[[nodiscard]] std::string_view status_name(GameStatus s) noexcept;

}  // namespace gambit::chess::movegen
