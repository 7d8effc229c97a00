#pragma once

/// @file bitboard.hpp
/// Bitboard type, bit helpers and attack generation.
///
/// Leaper attacks come from constexpr tables. Sliding attacks scan
/// precomputed rays and cut them at the first blocker, so no runtime
/// initialisation is needed.

#include <gambit/chess/types.hpp>

#include <bit>
#include <cstdint>

namespace gambit::chess {

using Bitboard = std::uint64_t;

inline constexpr Bitboard kEmptyBB = 0ULL;

// ── Bit manipulation ────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard square_bb(Square sq) noexcept {
    return 1ULL << sq;
}

[[nodiscard]] constexpr int popcount(Bitboard b) noexcept {
    return std::popcount(b);
}

[[nodiscard]] constexpr Square lsb(Bitboard b) noexcept {
    return static_cast<Square>(std::countr_zero(b));
}

[[nodiscard]] constexpr Square msb(Bitboard b) noexcept {
    return static_cast<Square>(63 - std::countl_zero(b));
}

/// Return and clear the least significant bit.
[[nodiscard]] constexpr Square pop_lsb(Bitboard& b) noexcept {
    Square sq = lsb(b);
    b &= b - 1;
    return sq;
}

[[nodiscard]] constexpr bool test_bit(Bitboard b, Square sq) noexcept {
    return (b >> sq) & 1;
}

constexpr void set_bit(Bitboard& b, Square sq) noexcept {
    b |= square_bb(sq);
}

constexpr void clear_bit(Bitboard& b, Square sq) noexcept {
    b &= ~square_bb(sq);
}

// ── Rank / File masks ───────────────────────────────────────────────────────

inline constexpr Bitboard kFileA = 0x0101010101010101ULL;
inline constexpr Bitboard kFileB = kFileA << 1;
inline constexpr Bitboard kFileG = kFileA << 6;
inline constexpr Bitboard kFileH = kFileA << 7;

inline constexpr Bitboard kRank1 = 0x00000000000000FFULL;
inline constexpr Bitboard kRank8 = kRank1 << 56;

inline constexpr Bitboard kLightSquares = 0x55AA55AA55AA55AAULL;

// ── Shift helpers ───────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard shift_north(Bitboard b) noexcept {
    return b << 8;
}
[[nodiscard]] constexpr Bitboard shift_south(Bitboard b) noexcept {
    return b >> 8;
}
[[nodiscard]] constexpr Bitboard shift_east(Bitboard b) noexcept {
    return (b << 1) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_west(Bitboard b) noexcept {
    return (b >> 1) & ~kFileH;
}
[[nodiscard]] constexpr Bitboard shift_ne(Bitboard b) noexcept {
    return (b << 9) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_nw(Bitboard b) noexcept {
    return (b << 7) & ~kFileH;
}
[[nodiscard]] constexpr Bitboard shift_se(Bitboard b) noexcept {
    return (b >> 7) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_sw(Bitboard b) noexcept {
    return (b >> 9) & ~kFileH;
}

/// Squares one pawn push ahead for `c`.
[[nodiscard]] constexpr Bitboard pawn_push(Color c, Bitboard b) noexcept {
    return c == Color::White ? shift_north(b) : shift_south(b);
}

// ── Attack tables ───────────────────────────────────────────────────────────

/// Ray directions. The first four increase the square index, the last four
/// decrease it; that decides whether the nearest blocker is the lsb or msb.
enum Direction : int {
    kNorth,
    kEast,
    kNorthEast,
    kNorthWest,
    kSouth,
    kWest,
    kSouthEast,
    kSouthWest,
};

namespace detail {

struct AttackTables {
    Bitboard knight[64]{};
    Bitboard king[64]{};
    Bitboard pawn[2][64]{};
    Bitboard ray[8][64]{};
};

constexpr Bitboard step(Bitboard bb, int dir) noexcept {
    switch (dir) {
        case kNorth:
            return shift_north(bb);
        case kEast:
            return shift_east(bb);
        case kNorthEast:
            return shift_ne(bb);
        case kNorthWest:
            return shift_nw(bb);
        case kSouth:
            return shift_south(bb);
        case kWest:
            return shift_west(bb);
        case kSouthEast:
            return shift_se(bb);
        default:
            return shift_sw(bb);
    }
}

constexpr AttackTables compute_tables() noexcept {
    AttackTables t{};
    for (int sq = 0; sq < 64; ++sq) {
        const Bitboard bb = square_bb(static_cast<Square>(sq));

        Bitboard n = kEmptyBB;
        n |= (bb << 17) & ~kFileA;
        n |= (bb << 15) & ~kFileH;
        n |= (bb << 10) & ~(kFileA | kFileB);
        n |= (bb << 6) & ~(kFileG | kFileH);
        n |= (bb >> 6) & ~(kFileA | kFileB);
        n |= (bb >> 10) & ~(kFileG | kFileH);
        n |= (bb >> 15) & ~kFileA;
        n |= (bb >> 17) & ~kFileH;
        t.knight[sq] = n;

        Bitboard k = kEmptyBB;
        for (int dir = 0; dir < 8; ++dir) {
            k |= step(bb, dir);
        }
        t.king[sq] = k;

        t.pawn[0][sq] = shift_ne(bb) | shift_nw(bb);
        t.pawn[1][sq] = shift_se(bb) | shift_sw(bb);

        for (int dir = 0; dir < 8; ++dir) {
            Bitboard ray = kEmptyBB;
            for (Bitboard cur = step(bb, dir); cur; cur = step(cur, dir)) {
                ray |= cur;
            }
            t.ray[dir][sq] = ray;
        }
    }
    return t;
}

inline constexpr AttackTables kTables = compute_tables();

/// Ray from `sq` in `dir`, cut after the first occupied square.
[[nodiscard]] constexpr Bitboard ray_attacks(Square sq, int dir, Bitboard occ) noexcept {
    Bitboard ray = kTables.ray[dir][sq];
    const Bitboard blockers = ray & occ;
    if (blockers) {
        const Square first = dir < kSouth ? lsb(blockers) : msb(blockers);
        ray ^= kTables.ray[dir][first];
    }
    return ray;
}

}  // namespace detail

[[nodiscard]] constexpr Bitboard knight_attacks(Square sq) noexcept {
    return detail::kTables.knight[sq];
}

[[nodiscard]] constexpr Bitboard king_attacks(Square sq) noexcept {
    return detail::kTables.king[sq];
}

/// Squares attacked by a pawn of colour `c` standing on `sq`.
[[nodiscard]] constexpr Bitboard pawn_attacks(Color c, Square sq) noexcept {
    return detail::kTables.pawn[color_index(c)][sq];
}

[[nodiscard]] constexpr Bitboard bishop_attacks(Square sq, Bitboard occ) noexcept {
    return detail::ray_attacks(sq, kNorthEast, occ) | detail::ray_attacks(sq, kNorthWest, occ) |
           detail::ray_attacks(sq, kSouthEast, occ) | detail::ray_attacks(sq, kSouthWest, occ);
}

[[nodiscard]] constexpr Bitboard rook_attacks(Square sq, Bitboard occ) noexcept {
    return detail::ray_attacks(sq, kNorth, occ) | detail::ray_attacks(sq, kEast, occ) |
           detail::ray_attacks(sq, kSouth, occ) | detail::ray_attacks(sq, kWest, occ);
}

[[nodiscard]] constexpr Bitboard queen_attacks(Square sq, Bitboard occ) noexcept {
    return bishop_attacks(sq, occ) | rook_attacks(sq, occ);
}

}  // namespace gambit::chess
