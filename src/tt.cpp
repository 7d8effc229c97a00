/// @file tt.cpp
/// Transposition table implementation.

#include <gambit/tt.hpp>

#include <algorithm>

namespace gambit {

// ── Helpers ─────────────────────────────────────────────────────────────────

/// Round down to the nearest power of 2.
static std::size_t round_down_pow2(std::size_t v) noexcept {
    if (v == 0)
        return 1;
    v |= v >> 1;
    v |= v >> 2;
    v |= v >> 4;
    v |= v >> 8;
    v |= v >> 16;
    v |= v >> 32;
    return (v >> 1) + 1;
}

// ── TranspositionTable ──────────────────────────────────────────────────────

TranspositionTable::TranspositionTable(std::size_t mb) {
    resize(mb);
}

void TranspositionTable::resize(std::size_t mb) {
    if (mb == 0)
        mb = 1;

    constexpr std::size_t kEntrySize = sizeof(TTEntry);
    std::size_t num_entries = round_down_pow2(mb * 1024ULL * 1024ULL / kEntrySize);
    num_entries = std::max(num_entries, std::size_t{1024});

    table_.assign(num_entries, TTEntry{});
    mask_ = num_entries - 1;
    age_ = 0;
}

void TranspositionTable::clear() {
    std::fill(table_.begin(), table_.end(), TTEntry{});
    age_ = 0;
}

void TranspositionTable::new_search() noexcept {
    ++age_;
}

bool TranspositionTable::probe(std::uint64_t key, TTEntry& entry) const noexcept {
    const auto& slot = table_[index(key)];
    if (slot.bound != Bound::None && slot.key32 == key_upper(key)) {
        entry = slot;
        return true;
    }
    return false;
}

void TranspositionTable::store(std::uint64_t key, int depth, Score score, Bound bound,
                               std::uint16_t move_index) noexcept {
    auto& slot = table_[index(key)];
    const auto key32 = key_upper(key);

    // 1. Always replace empty or stale entries.
    // 2. Same age: replace if at least as deep, or if exact beats non-exact.
    bool should_replace = (slot.bound == Bound::None) || (slot.age != age_) ||
                          (depth >= slot.depth) ||
                          (bound == Bound::Exact && slot.bound != Bound::Exact);
    if (!should_replace)
        return;

    // Keep the known best move when re-storing the same position without one.
    if (slot.key32 == key32 && move_index == kNoMoveIndex) {
        move_index = slot.move_index;
    }

    slot.key32 = key32;
    slot.score = score;
    slot.move_index = move_index;
    slot.depth = static_cast<std::uint8_t>(depth);
    slot.bound = bound;
    slot.age = age_;
}

int TranspositionTable::hashfull() const noexcept {
    if (table_.empty())
        return 0;
    const std::size_t sample_size = std::min(table_.size(), std::size_t{1000});
    int used = 0;
    for (std::size_t i = 0; i < sample_size; ++i) {
        if (table_[i].bound != Bound::None && table_[i].age == age_) {
            ++used;
        }
    }
    return static_cast<int>(used * 1000 / sample_size);
}

}  // namespace gambit
