/// @file board.cpp
/// Board implementation: initial position factory.

#include <gambit/chess/board.hpp>

namespace gambit::chess {

Board Board::initial() noexcept {
    constexpr PieceType kBackRank[] = {
        PieceType::Rook, PieceType::Knight, PieceType::Bishop, PieceType::Queen,
        PieceType::King, PieceType::Bishop, PieceType::Knight, PieceType::Rook,
    };

    Board b;
    for (int f = 0; f < 8; ++f) {
        b.put_piece(make_square(f, 0), {Color::White, kBackRank[f]});
        b.put_piece(make_square(f, 1), {Color::White, PieceType::Pawn});
        b.put_piece(make_square(f, 6), {Color::Black, PieceType::Pawn});
        b.put_piece(make_square(f, 7), {Color::Black, kBackRank[f]});
    }
    return b;
}

}  // namespace gambit::chess
