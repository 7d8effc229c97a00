#pragma once

/// @file board.hpp
/// Pieces and the bitboard board with mailbox redundancy.

#include <gambit/chess/bitboard.hpp>
#include <gambit/chess/types.hpp>

namespace gambit::chess {

// ── Piece ───────────────────────────────────────────────────────────────────

struct Piece {
    Color color;
    PieceType type;

    [[nodiscard]] constexpr bool operator==(const Piece&) const noexcept = default;

    /// FEN character ('P'..'K' for white, lowercase for black, ' ' for none).
    [[nodiscard]] constexpr char fen_char() const noexcept {
        constexpr char kChars[2][8] = {" PNBRQK", " pnbrqk"};
        return kChars[color_index(color)][static_cast<int>(type)];
    }

    /// Parse a FEN piece character. Returns a piece of type None on failure.
    [[nodiscard]] static constexpr Piece from_fen_char(char ch) noexcept {
        constexpr char kWhite[] = "PNBRQK";
        constexpr char kBlack[] = "pnbrqk";
        for (int i = 0; i < kNumPieceTypes; ++i) {
            if (ch == kWhite[i])
                return {Color::White, static_cast<PieceType>(i + 1)};
            if (ch == kBlack[i])
                return {Color::Black, static_cast<PieceType>(i + 1)};
        }
        return {Color::White, PieceType::None};
    }
};

inline constexpr Piece kNoPiece{Color::White, PieceType::None};

// ── Board ───────────────────────────────────────────────────────────────────

/// 12 piece bitboards, occupancy per colour and a 64-square mailbox.
class Board {
   public:
    Board() noexcept = default;

    /// Place a piece on an empty square.
    void put_piece(Square sq, Piece p) noexcept {
        set_bit(pieces_[color_index(p.color)][piece_index(p.type)], sq);
        set_bit(occupied_[color_index(p.color)], sq);
        mailbox_[sq] = p;
    }

    /// Remove the piece on an occupied square.
    void remove_piece(Square sq) noexcept {
        const Piece p = mailbox_[sq];
        clear_bit(pieces_[color_index(p.color)][piece_index(p.type)], sq);
        clear_bit(occupied_[color_index(p.color)], sq);
        mailbox_[sq] = kNoPiece;
    }

    /// Move a piece from `from` to an empty `to`.
    void move_piece(Square from, Square to) noexcept {
        const Piece p = mailbox_[from];
        const Bitboard mask = square_bb(from) | square_bb(to);
        pieces_[color_index(p.color)][piece_index(p.type)] ^= mask;
        occupied_[color_index(p.color)] ^= mask;
        mailbox_[to] = p;
        mailbox_[from] = kNoPiece;
    }

    [[nodiscard]] Piece piece_at(Square sq) const noexcept { return mailbox_[sq]; }

    [[nodiscard]] bool is_empty(Square sq) const noexcept {
        return mailbox_[sq].type == PieceType::None;
    }

    [[nodiscard]] Bitboard pieces(Color c, PieceType pt) const noexcept {
        return pieces_[color_index(c)][piece_index(pt)];
    }

    [[nodiscard]] Bitboard occupied(Color c) const noexcept { return occupied_[color_index(c)]; }

    [[nodiscard]] Bitboard occupied_all() const noexcept { return occupied_[0] | occupied_[1]; }

    [[nodiscard]] Square king_square(Color c) const noexcept {
        const Bitboard k = pieces(c, PieceType::King);
        return k ? lsb(k) : kNoSquare;
    }

    /// Is `sq` attacked by any piece of colour `by`?
    [[nodiscard]] bool is_attacked(Square sq, Color by) const noexcept {
        const Bitboard occ = occupied_all();
        if (pawn_attacks(opposite(by), sq) & pieces(by, PieceType::Pawn))
            return true;
        if (knight_attacks(sq) & pieces(by, PieceType::Knight))
            return true;
        if (king_attacks(sq) & pieces(by, PieceType::King))
            return true;
        const Bitboard queens = pieces(by, PieceType::Queen);
        if (bishop_attacks(sq, occ) & (pieces(by, PieceType::Bishop) | queens))
            return true;
        return (rook_attacks(sq, occ) & (pieces(by, PieceType::Rook) | queens)) != 0;
    }

    /// Standard starting position.
    [[nodiscard]] static Board initial() noexcept;

   private:
    Bitboard pieces_[2][kNumPieceTypes]{};
    Bitboard occupied_[2]{};
    Piece mailbox_[64]{};
};

}  // namespace gambit::chess
