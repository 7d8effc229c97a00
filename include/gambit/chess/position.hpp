#pragma once

/// @file position.hpp
/// Complete chess position: board, side to move, castling, en passant, clocks.
///
/// make_move / unmake_move keep an undo stack and update the Zobrist key
/// incrementally. The key history since construction backs repetition
/// detection.

#include <gambit/chess/board.hpp>
#include <gambit/chess/move.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gambit::chess {

inline constexpr std::string_view kStartingFen =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

/// State saved before each move so it can be undone.
struct UndoInfo {
    CastlingRights castling;
    Square en_passant;
    int halfmove_clock;
    Piece captured;  ///< kNoPiece if no capture
    std::uint64_t key;
};

namespace detail {

/// Castling rights that survive a move touching each square:
/// `castling = castling & kCastleMask[from] & kCastleMask[to]`.
constexpr auto make_castling_masks() noexcept {
    std::array<CastlingRights, 64> masks{};
    for (auto& m : masks) m = kCastlingAll;
    masks[A1] = static_cast<CastlingRights>(kCastlingAll & ~kWhiteQueenside);
    masks[H1] = static_cast<CastlingRights>(kCastlingAll & ~kWhiteKingside);
    masks[E1] = static_cast<CastlingRights>(kCastlingAll & ~kWhiteBoth);
    masks[A8] = static_cast<CastlingRights>(kCastlingAll & ~kBlackQueenside);
    masks[H8] = static_cast<CastlingRights>(kCastlingAll & ~kBlackKingside);
    masks[E8] = static_cast<CastlingRights>(kCastlingAll & ~kBlackBoth);
    return masks;
}

inline constexpr auto kCastleMask = make_castling_masks();

}  // namespace detail

class Position {
   public:
    Position(Board board, Color side, CastlingRights castling, Square ep, int halfmove,
             int fullmove);

    /// Empty board, white to move, no castling, no en passant.
    Position();

    [[nodiscard]] static Position initial();

    /// Parse a FEN string. Throws std::invalid_argument on bad input.
    [[nodiscard]] static Position from_fen(std::string_view fen);

    [[nodiscard]] std::string to_fen() const;

    /// The same position with colours swapped and ranks reflected.
    [[nodiscard]] Position mirrored() const;

    // ── Move operations ─────────────────────────────────────────────────

    void make_move(Move m);

    /// Undo the last make_move, which must have been `m`.
    void unmake_move(Move m);

    // ── Accessors ───────────────────────────────────────────────────────

    [[nodiscard]] const Board& board() const noexcept { return board_; }
    [[nodiscard]] Color side_to_move() const noexcept { return side_to_move_; }
    [[nodiscard]] CastlingRights castling() const noexcept { return castling_; }
    [[nodiscard]] Square en_passant() const noexcept { return en_passant_; }
    [[nodiscard]] int halfmove_clock() const noexcept { return halfmove_clock_; }
    [[nodiscard]] int fullmove_number() const noexcept { return fullmove_number_; }
    [[nodiscard]] std::uint64_t key() const noexcept { return key_; }

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] bool is_square_attacked(Square sq, Color by) const noexcept {
        return board_.is_attacked(sq, by);
    }

    /// Is the side to move in check?
    [[nodiscard]] bool is_in_check() const noexcept { return is_in_check(side_to_move_); }

    [[nodiscard]] bool is_in_check(Color c) const noexcept;

    /// How many times the current key has occurred (including now).
    [[nodiscard]] int repetition_count() const;

    /// K v K, K+minor v K, or K+B v K+B with same-coloured bishops.
    [[nodiscard]] bool has_insufficient_material() const noexcept;

   private:
    void compute_key();
    void set_castling(CastlingRights cr);
    void set_en_passant(Square ep);
    void put(Square sq, Piece p);
    void remove(Square sq);

    Board board_;
    Color side_to_move_ = Color::White;
    CastlingRights castling_ = kCastlingNone;
    Square en_passant_ = kNoSquare;
    int halfmove_clock_ = 0;
    int fullmove_number_ = 1;
    std::uint64_t key_ = 0;
    std::vector<UndoInfo> history_;
    std::vector<std::uint64_t> key_history_;
};

}  // namespace gambit::chess
