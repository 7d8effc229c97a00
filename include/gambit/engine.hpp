#pragma once

/// @file engine.hpp
/// High-level chess engine facade: a depth setting over ChessSearcher.

#include <gambit/chess/game.hpp>

namespace gambit {

/// Top-level chess engine API used by the CLI and the Python bindings.
class Engine {
   public:
    static constexpr int kMinDepth = 1;
    static constexpr int kMaxDepth = 10;
    static constexpr int kDefaultDepth = 3;

    explicit Engine(int depth = kDefaultDepth);

    /// Set the search depth, clamped to [kMinDepth, kMaxDepth].
    void set_depth(int depth) noexcept;
    [[nodiscard]] int depth() const noexcept { return config_.max_depth; }

    /// Options used by choose_best_move(pos). max_depth tracks set_depth.
    [[nodiscard]] SearchConfig& config() noexcept { return config_; }
    [[nodiscard]] const SearchConfig& config() const noexcept { return config_; }

    /// Search with the engine's own configuration.
    chess::ChessResult choose_best_move(const chess::Position& pos);

    /// Search with an explicit configuration (max_depth is not clamped).
    chess::ChessResult choose_best_move(const chess::Position& pos, const SearchConfig& config);

    /// Cancel the running search, or the next one if none is running (thread-safe).
    void cancel() noexcept;

    /// White-perspective score of `pos` without search. Finished games
    /// score exactly (mate = +/-kWinScore, draw = 0).
    [[nodiscard]] Score evaluate(const chess::Position& pos) const;

   private:
    chess::ChessSearcher searcher_;
    SearchConfig config_{};
};

}  // namespace gambit
