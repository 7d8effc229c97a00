#pragma once

/// @file game.hpp
/// Chess bound to the search contract: White is the Maximizer.

#include <gambit/chess/evaluation.hpp>
#include <gambit/chess/movegen.hpp>
#include <gambit/chess/position.hpp>
#include <gambit/search.hpp>

#include <cstdint>

namespace gambit::chess {

/// Map a game status to a search outcome. Checkmate loses for the side to move.
[[nodiscard]] Outcome to_outcome(movegen::GameStatus status, Color side_to_move) noexcept;

class ChessGame {
   public:
    using Position = chess::Position;
    using Move = chess::Move;

    [[nodiscard]] MoveList legal_moves(Position& pos) const { return movegen::legal(pos); }

    void play(Position& pos, const Move& m) const { pos.make_move(m); }
    void undo(Position& pos, const Move& m) const { pos.unmake_move(m); }

    [[nodiscard]] Outcome outcome(Position& pos) const {
        return to_outcome(movegen::status(pos), pos.side_to_move());
    }

    [[nodiscard]] Side side_to_move(const Position& pos) const noexcept {
        return side_of(pos.side_to_move());
    }

    [[nodiscard]] std::uint64_t key(const Position& pos) const noexcept { return pos.key(); }

    /// Captures by 10 * victim - attacker, then bonuses for check,
    /// promotion and a central destination.
    [[nodiscard]] int move_priority(Position& pos, const Move& m) const;
};

/// White-perspective static evaluation.
struct ChessEvaluator {
    [[nodiscard]] Score operator()(const Position& pos) const { return eval::evaluate(pos); }
};

using ChessSearcher = Searcher<ChessGame, ChessEvaluator>;
using ChessResult = SearchResult<Move>;

}  // namespace gambit::chess
