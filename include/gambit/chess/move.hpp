#pragma once

/// @file move.hpp
/// Packed chess move and the move list handed to the search.

#include <gambit/chess/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace gambit::chess {

/// What a move does besides relocating one piece. Promotions carry the new
/// piece in the kind, in PieceType order.
enum class MoveKind : std::uint8_t {
    Quiet,
    DoublePush,
    EnPassant,
    CastleKingside,
    CastleQueenside,
    PromoteKnight,
    PromoteBishop,
    PromoteRook,
    PromoteQueen,
};

/// 16-bit move: bits 0-5 origin, 6-11 destination, 12-15 MoveKind.
/// A default-constructed move is a1a1 and never generated.
class Move {
   public:
    constexpr Move() noexcept = default;
    constexpr Move(Square from, Square to, MoveKind kind = MoveKind::Quiet) noexcept
        : bits_(static_cast<std::uint16_t>(from | (to << 6) | (static_cast<int>(kind) << 12))) {}

    /// Pawn move to the last rank becoming `pt` (Knight..Queen).
    [[nodiscard]] static constexpr Move promote(Square from, Square to, PieceType pt) noexcept {
        const int offset = static_cast<int>(pt) - static_cast<int>(PieceType::Knight);
        return {from, to,
                static_cast<MoveKind>(static_cast<int>(MoveKind::PromoteKnight) + offset)};
    }

    [[nodiscard]] constexpr Square from() const noexcept { return bits_ & 63; }
    [[nodiscard]] constexpr Square to() const noexcept { return (bits_ >> 6) & 63; }
    [[nodiscard]] constexpr MoveKind kind() const noexcept {
        return static_cast<MoveKind>(bits_ >> 12);
    }

    [[nodiscard]] constexpr bool is_castle() const noexcept {
        return kind() == MoveKind::CastleKingside || kind() == MoveKind::CastleQueenside;
    }
    [[nodiscard]] constexpr bool is_promotion() const noexcept {
        return kind() >= MoveKind::PromoteKnight;
    }
    /// Piece a promotion creates; None for every other move.
    [[nodiscard]] constexpr PieceType promoted() const noexcept {
        if (!is_promotion())
            return PieceType::None;
        return static_cast<PieceType>(static_cast<int>(PieceType::Knight) +
                                      static_cast<int>(kind()) -
                                      static_cast<int>(MoveKind::PromoteKnight));
    }

    [[nodiscard]] constexpr std::uint16_t raw() const noexcept { return bits_; }
    [[nodiscard]] constexpr bool operator==(const Move&) const noexcept = default;

    /// Long algebraic form: "e2e4", "e7e8q". Castling is the king's move.
    [[nodiscard]] std::string uci() const {
        std::string s = square_name(from()) + square_name(to());
        if (is_promotion())
            s += static_cast<char>(piece_letter(promoted()) - 'A' + 'a');
        return s;
    }

   private:
    std::uint16_t bits_ = 0;
};

// ── MoveList ────────────────────────────────────────────────────────────────

/// Moves of one position in generation order. No chess position has more
/// than 218 legal moves, so a fixed buffer on the stack is enough.
class MoveList {
   public:
    static constexpr std::size_t kCapacity = 256;

    constexpr void push(Move m) noexcept { moves_[size_++] = m; }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return size_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] constexpr const Move& operator[](std::size_t i) const noexcept {
        return moves_[i];
    }

    [[nodiscard]] constexpr const Move* begin() const noexcept { return moves_.data(); }
    [[nodiscard]] constexpr const Move* end() const noexcept { return moves_.data() + size_; }

    [[nodiscard]] bool contains(const Move& m) const noexcept {
        for (const Move& x : *this) {
            if (x == m)
                return true;
        }
        return false;
    }

   private:
    std::array<Move, kCapacity> moves_{};
    std::size_t size_ = 0;
};

}  // namespace gambit::chess
