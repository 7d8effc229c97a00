#pragma once

/// @file score.hpp
/// Score scale, sides and game outcomes shared by every game and the search.
///
/// Scores are always from the Maximizer's point of view. Terminal scores
/// live outside the heuristic range so a forced result always dominates.

#include <algorithm>
#include <cstdint>
#include <string_view>

namespace gambit {

using Score = int;

// ── Constants ───────────────────────────────────────────────────────────────

inline constexpr Score kInfScore = 1'000'000;
inline constexpr Score kWinScore = 100'000;
inline constexpr Score kDrawScore = 0;
inline constexpr int kMaxPly = 128;
inline constexpr Score kMaxHeuristicScore = kWinScore - kMaxPly - 1;

// ── Side ────────────────────────────────────────────────────────────────────

enum class Side : std::uint8_t { Maximizer = 0, Minimizer = 1 };

[[nodiscard]] constexpr Side opposite(Side s) noexcept {
    return s == Side::Maximizer ? Side::Minimizer : Side::Maximizer;
}

[[nodiscard]] constexpr std::string_view side_name(Side s) noexcept {
    return s == Side::Maximizer ? "maximizer" : "minimizer";
}

// ── Outcome ─────────────────────────────────────────────────────────────────

/// Terminal classification reported by a game's rules.
enum class Outcome : std::uint8_t {
    Ongoing = 0,
    MaximizerWins = 1,
    MinimizerWins = 2,
    Draw = 3,
};

[[nodiscard]] constexpr std::string_view outcome_name(Outcome o) noexcept {
    switch (o) {
        case Outcome::Ongoing:
            return "ongoing";
        case Outcome::MaximizerWins:
            return "maximizer wins";
        case Outcome::MinimizerWins:
            return "minimizer wins";
        case Outcome::Draw:
            return "draw";
    }
    return "unknown";
}

// ── Score helpers ───────────────────────────────────────────────────────────

/// Exact score of a terminal position reached `ply` half-moves below the root.
/// Quicker wins and slower losses score better for the winner/loser.
[[nodiscard]] constexpr Score terminal_score(Outcome o, int ply) noexcept {
    switch (o) {
        case Outcome::MaximizerWins:
            return kWinScore - ply;
        case Outcome::MinimizerWins:
            return -kWinScore + ply;
        default:
            return kDrawScore;
    }
}

/// Clamp a heuristic evaluation so it can never reach a terminal score.
[[nodiscard]] constexpr Score clamp_heuristic(Score s) noexcept {
    return std::clamp(s, -kMaxHeuristicScore, kMaxHeuristicScore);
}

/// True if `s` encodes a forced win or loss.
[[nodiscard]] constexpr bool is_decisive(Score s) noexcept {
    return s > kMaxHeuristicScore || s < -kMaxHeuristicScore;
}

/// Plies to the forced result encoded in a decisive score, -1 otherwise.
[[nodiscard]] constexpr int plies_to_result(Score s) noexcept {
    if (s > kMaxHeuristicScore)
        return kWinScore - s;
    if (s < -kMaxHeuristicScore)
        return kWinScore + s;
    return -1;
}

}  // namespace gambit
