/// @file engine.cpp
/// Engine facade implementation.

#include <gambit/engine.hpp>

#include <algorithm>

namespace gambit {

Engine::Engine(int depth) {
    set_depth(depth);
}

void Engine::set_depth(int depth) noexcept {
    config_.max_depth = std::clamp(depth, kMinDepth, kMaxDepth);
}

chess::ChessResult Engine::choose_best_move(const chess::Position& pos) {
    return searcher_.choose_best_move(pos, config_);
}

chess::ChessResult Engine::choose_best_move(const chess::Position& pos,
                                            const SearchConfig& config) {
    return searcher_.choose_best_move(pos, config);
}

void Engine::cancel() noexcept {
    searcher_.cancel();
}

Score Engine::evaluate(const chess::Position& pos) const {
    const Outcome outcome = chess::to_outcome(chess::movegen::status(pos), pos.side_to_move());
    if (outcome != Outcome::Ongoing)
        return terminal_score(outcome, 0);
    return clamp_heuristic(searcher_.evaluator()(pos));
}

}  // namespace gambit
