#pragma once

/// @file game.hpp
/// The rules contract consumed by the search, plus generic helpers.
///
/// A game type `G` used with `Searcher<G, Eval>` provides:
///
///     using Position = ...;   // copyable game state
///     using Move = ...;       // copyable, operator==
///
///     MoveList legal_moves(Position& pos) const;          // random-access range of Move
///     void play(Position& pos, const Move& m) const;      // apply a legal move
///     void undo(Position& pos, const Move& m) const;      // revert the last play(m)
///     Outcome outcome(Position& pos) const;               // Ongoing unless game over
///     Side side_to_move(const Position& pos) const;
///     std::uint64_t key(const Position& pos) const;       // hash, used by the TT
///     int move_priority(Position& pos, const Move& m) const;  // ordering hint, higher first
///
/// `legal_moves`, `outcome` and `move_priority` take a mutable position because a rules
/// module may probe legality with play/undo; the position is restored
/// before they return. Playing an illegal move is undefined.
///
/// An evaluator is any callable `Score(const Position&)` that is
/// deterministic and free of side effects, scoring from the Maximizer's
/// point of view.

#include <gambit/score.hpp>

namespace gambit {

/// Copy `pos`, play `m` on the copy and return it. `pos` is left untouched.
template <typename Game>
[[nodiscard]] typename Game::Position apply(const Game& game, typename Game::Position pos,
                                            const typename Game::Move& m) {
    game.play(pos, m);
    return pos;
}

/// True once the game is over (win, loss or draw).
template <typename Game>
[[nodiscard]] bool is_terminal(const Game& game, typename Game::Position& pos) {
    return game.outcome(pos) != Outcome::Ongoing;
}

}  // namespace gambit
