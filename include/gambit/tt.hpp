#pragma once

/// @file tt.hpp
/// Transposition table for caching search results.
///
/// Uses a power-of-2 sized hash table with single-entry buckets.
/// Replacement policy: always-replace with age preference (newer entries
/// take priority; among same-age entries, deeper entries are preferred).
///
/// The table is game-agnostic: it stores the best move as its index in the
/// position's move generation order, not the move itself.

#include <gambit/score.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gambit {

// ── Bound type ──────────────────────────────────────────────────────────────

/// The type of score stored in a TT entry.
enum class Bound : std::uint8_t {
    None = 0,   ///< Invalid / empty entry.
    Exact = 1,  ///< Exact minimax score.
    Lower = 2,  ///< True score is >= stored score (search failed high).
    Upper = 3,  ///< True score is <= stored score (search failed low).
};

inline constexpr std::uint16_t kNoMoveIndex = 0xFFFF;

// ── TT entry ────────────────────────────────────────────────────────────────

/// A single transposition table entry (16 bytes).
struct TTEntry {
    std::uint32_t key32 = 0;                 ///< Upper 32 bits of the key for verification.
    std::int32_t score = 0;                  ///< Score, win/loss scores relative to this node.
    std::uint16_t move_index = kNoMoveIndex;  ///< Best move, index in generation order.
    std::uint8_t depth = 0;                  ///< Remaining depth the score was searched to.
    Bound bound = Bound::None;               ///< Type of bound.
    std::uint8_t age = 0;                    ///< Search generation (for replacement).
    std::uint8_t padding_[3]{};              ///< Padding to 16 bytes.
};

static_assert(sizeof(TTEntry) == 16, "TTEntry must be 16 bytes for cache efficiency");

// ── Win/loss score adjustment ───────────────────────────────────────────────

/// Convert a root-relative decisive score to a node-relative one for storage.
[[nodiscard]] constexpr Score score_to_tt(Score s, int ply) noexcept {
    if (s > kMaxHeuristicScore)
        return s + ply;
    if (s < -kMaxHeuristicScore)
        return s - ply;
    return s;
}

/// Inverse of score_to_tt.
[[nodiscard]] constexpr Score score_from_tt(Score s, int ply) noexcept {
    if (s > kMaxHeuristicScore)
        return s - ply;
    if (s < -kMaxHeuristicScore)
        return s + ply;
    return s;
}

// ── Transposition table ─────────────────────────────────────────────────────

class TranspositionTable {
   public:
    static constexpr std::size_t kDefaultSizeMB = 16;

    /// Construct with given size in megabytes. Rounds down to a power of 2 entry count.
    explicit TranspositionTable(std::size_t mb = kDefaultSizeMB);

    /// Resize the table (clears all entries).
    void resize(std::size_t mb);

    /// Clear all entries (zero-fill).
    void clear();

    /// Increment the age counter. Called at the start of each iteration.
    void new_search() noexcept;

    /// Probe the table for the given key.
    /// @param key Full 64-bit position hash.
    /// @param[out] entry Filled with the stored entry on hit.
    /// @return true if the entry matches the key (hit), false otherwise (miss).
    [[nodiscard]] bool probe(std::uint64_t key, TTEntry& entry) const noexcept;

    /// Store / overwrite an entry.
    void store(std::uint64_t key, int depth, Score score, Bound bound,
               std::uint16_t move_index) noexcept;

    /// Number of entries in the table.
    [[nodiscard]] std::size_t entry_count() const noexcept { return table_.size(); }

    /// Current age.
    [[nodiscard]] std::uint8_t age() const noexcept { return age_; }

    /// Approximate fill rate in per-mille (0-1000), sampled over the first 1000 entries.
    [[nodiscard]] int hashfull() const noexcept;

   private:
    [[nodiscard]] static constexpr std::uint32_t key_upper(std::uint64_t key) noexcept {
        return static_cast<std::uint32_t>(key >> 32);
    }

    [[nodiscard]] std::size_t index(std::uint64_t key) const noexcept {
        return static_cast<std::size_t>(key) & mask_;
    }

    std::vector<TTEntry> table_;
    std::size_t mask_ = 0;
    std::uint8_t age_ = 0;
};

}  // namespace gambit
