/// @file game.cpp
/// Outcome mapping and the chess move-ordering hint.

#include <gambit/chess/game.hpp>

namespace gambit::chess {

namespace {

constexpr int kOrderValue[kNumPieceTypes] = {1, 3, 3, 5, 9, 100};

constexpr int kCheckBonus = 900;
constexpr int kPromotionBonus = 800;
constexpr int kCenterBonus = 50;

int order_value(PieceType pt) noexcept {
    return pt == PieceType::None ? 0 : kOrderValue[piece_index(pt)];
}

}  // namespace

Outcome to_outcome(movegen::GameStatus status, Color side_to_move) noexcept {
    switch (status) {
        case movegen::GameStatus::Ongoing:
            return Outcome::Ongoing;
        case movegen::GameStatus::Checkmate:
            return side_to_move == Color::White ? Outcome::MinimizerWins
                                                : Outcome::MaximizerWins;
        default:
            return Outcome::Draw;
    }
}

int ChessGame::move_priority(Position& pos, const Move& m) const {
    const Board& board = pos.board();
    int priority = 0;

    const PieceType attacker = board.piece_at(m.from()).type;
    const PieceType victim =
        (m.kind() == MoveKind::EnPassant) ? PieceType::Pawn : board.piece_at(m.to()).type;
    if (victim != PieceType::None) {
        priority += 10 * order_value(victim) - order_value(attacker);
    }

    pos.make_move(m);
    if (pos.is_in_check())
        priority += kCheckBonus;
    pos.unmake_move(m);

    if (m.is_promotion())
        priority += kPromotionBonus;

    const int f = file_of(m.to());
    const int r = rank_of(m.to());
    if (f >= 2 && f <= 5 && r >= 2 && r <= 5)
        priority += kCenterBonus;

    return priority;
}

}  // namespace gambit::chess
