#pragma once

/// @file zobrist.hpp
/// Zobrist hashing keys, generated at compile time with splitmix64.

#include <gambit/chess/types.hpp>

#include <cstdint>

namespace gambit::chess::zobrist {

inline constexpr std::uint64_t kSeed = 0x9D39247E33776D41ULL;

[[nodiscard]] constexpr std::uint64_t splitmix64(std::uint64_t state) noexcept {
    std::uint64_t z = state + 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

namespace detail {

struct ZobristKeys {
    std::uint64_t piece[2][6][64]{};  // [color][piece_index][square]
    std::uint64_t side_to_move{};
    std::uint64_t castling[16]{};
    std::uint64_t en_passant_file[8]{};
};

constexpr ZobristKeys compute_keys() noexcept {
    ZobristKeys keys{};
    std::uint64_t n = 0;
    auto next = [&n]() { return splitmix64(kSeed + n++); };

    for (auto& color : keys.piece) {
        for (auto& type : color) {
            for (auto& sq : type) sq = next();
        }
    }
    keys.side_to_move = next();
    for (auto& k : keys.castling) k = next();
    for (auto& k : keys.en_passant_file) k = next();
    return keys;
}

inline constexpr ZobristKeys kKeys = compute_keys();

}  // namespace detail

[[nodiscard]] constexpr std::uint64_t piece_key(Color color, PieceType pt, Square sq) noexcept {
    return detail::kKeys.piece[color_index(color)][piece_index(pt)][sq];
}

[[nodiscard]] constexpr std::uint64_t side_to_move_key() noexcept {
    return detail::kKeys.side_to_move;
}

[[nodiscard]] constexpr std::uint64_t castling_key(CastlingRights cr) noexcept {
    return detail::kKeys.castling[static_cast<int>(cr) & 0xF];
}

/// En passant is hashed by file only; the rank follows from the side to move.
[[nodiscard]] constexpr std::uint64_t en_passant_key(Square sq) noexcept {
    return detail::kKeys.en_passant_file[file_of(sq)];
}

}  // namespace gambit::chess::zobrist
