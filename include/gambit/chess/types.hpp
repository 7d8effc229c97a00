#pragma once

/// @file types.hpp
/// Chess vocabulary shared by the board, the rules and the search adapter.

#include <gambit/score.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gambit::chess {

// ── Squares ─────────────────────────────────────────────────────────────────
// a1 = 0 .. h1 = 7, a2 = 8 .. h8 = 63. File in the low three bits.
using Square = std::uint8_t;

/// "No square": empty en passant target, missing king.
inline constexpr Square kNoSquare = 64;

[[nodiscard]] constexpr int file_of(Square sq) noexcept { return sq & 7; }
[[nodiscard]] constexpr int rank_of(Square sq) noexcept { return sq >> 3; }

[[nodiscard]] constexpr Square make_square(int file, int rank) noexcept {
    return static_cast<Square>((rank << 3) | file);
}

/// Same file, rank reflected (a1 <-> a8). Used for colour mirroring.
[[nodiscard]] constexpr Square flip_rank(Square sq) noexcept {
    return static_cast<Square>(sq ^ 56);
}

/// "e4" style coordinate.
[[nodiscard]] inline std::string square_name(Square sq) {
    return {static_cast<char>('a' + file_of(sq)), static_cast<char>('1' + rank_of(sq))};
}

/// Inverse of square_name; nullopt unless `text` is exactly a file and a rank.
[[nodiscard]] inline std::optional<Square> parse_square(std::string_view text) noexcept {
    if (text.size() != 2 || text[0] < 'a' || text[0] > 'h' || text[1] < '1' || text[1] > '8')
        return std::nullopt;
    return make_square(text[0] - 'a', text[1] - '1');
}

// clang-format off
enum SquareConstants : Square {
    A1, B1, C1, D1, E1, F1, G1, H1,
    A2, B2, C2, D2, E2, F2, G2, H2,
    A3, B3, C3, D3, E3, F3, G3, H3,
    A4, B4, C4, D4, E4, F4, G4, H4,
    A5, B5, C5, D5, E5, F5, G5, H5,
    A6, B6, C6, D6, E6, F6, G6, H6,
    A7, B7, C7, D7, E7, F7, G7, H7,
    A8, B8, C8, D8, E8, F8, G8, H8,
};
// clang-format on

// ── Colours ─────────────────────────────────────────────────────────────────
enum class Color : std::uint8_t { White = 0, Black = 1 };

[[nodiscard]] constexpr Color opposite(Color c) noexcept {
    return c == Color::White ? Color::Black : Color::White;
}
[[nodiscard]] constexpr int color_index(Color c) noexcept { return static_cast<int>(c); }

/// White always plays the Maximizer.
[[nodiscard]] constexpr Side side_of(Color c) noexcept {
    return c == Color::White ? Side::Maximizer : Side::Minimizer;
}

/// Rank index (0-based) of `c`'s back rank.
[[nodiscard]] constexpr int home_rank(Color c) noexcept { return c == Color::White ? 0 : 7; }

// ── Piece types ─────────────────────────────────────────────────────────────
enum class PieceType : std::uint8_t { None, Pawn, Knight, Bishop, Rook, Queen, King };

inline constexpr int kNumPieceTypes = 6;

/// Table index, Pawn = 0 .. King = 5.
[[nodiscard]] constexpr int piece_index(PieceType pt) noexcept {
    return static_cast<int>(pt) - 1;
}

/// Upper-case SAN letter ('P' for pawns, ' ' for None).
[[nodiscard]] constexpr char piece_letter(PieceType pt) noexcept {
    return " PNBRQK"[static_cast<int>(pt)];
}

/// Piece named by an upper-case SAN letter. Pawns have no SAN letter.
[[nodiscard]] constexpr std::optional<PieceType> piece_from_letter(char ch) noexcept {
    switch (ch) {
        case 'N':
            return PieceType::Knight;
        case 'B':
            return PieceType::Bishop;
        case 'R':
            return PieceType::Rook;
        case 'Q':
            return PieceType::Queen;
        case 'K':
            return PieceType::King;
        default:
            return std::nullopt;
    }
}

// ── Castling rights ─────────────────────────────────────────────────────────
// Four independent bits; FEN order KQkq from the low bit up.
using CastlingRights = std::uint8_t;

inline constexpr CastlingRights kCastlingNone = 0;
inline constexpr CastlingRights kWhiteKingside = 1 << 0;
inline constexpr CastlingRights kWhiteQueenside = 1 << 1;
inline constexpr CastlingRights kBlackKingside = 1 << 2;
inline constexpr CastlingRights kBlackQueenside = 1 << 3;
inline constexpr CastlingRights kWhiteBoth = kWhiteKingside | kWhiteQueenside;
inline constexpr CastlingRights kBlackBoth = kBlackKingside | kBlackQueenside;
inline constexpr CastlingRights kCastlingAll = kWhiteBoth | kBlackBoth;

[[nodiscard]] constexpr CastlingRights kingside_right(Color c) noexcept {
    return c == Color::White ? kWhiteKingside : kBlackKingside;
}
[[nodiscard]] constexpr CastlingRights queenside_right(Color c) noexcept {
    return c == Color::White ? kWhiteQueenside : kBlackQueenside;
}

}  // namespace gambit::chess
