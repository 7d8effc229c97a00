/// @file movegen.cpp
/// Move generation over bitboards; legality is tested on a board copy.

#include <gambit/chess/movegen.hpp>

namespace gambit::chess::movegen {

namespace {

// ── Helpers ─────────────────────────────────────────────────────────────────

constexpr PieceType kPromotions[] = {PieceType::Queen, PieceType::Rook, PieceType::Bishop,
                                     PieceType::Knight};

void push_targets(MoveList& ml, Square from, Bitboard targets) {
    while (targets) {
        ml.push({from, pop_lsb(targets)});
    }
}

void push_pawn_move(MoveList& ml, Square from, Square to, Bitboard promo_rank) {
    if (test_bit(promo_rank, to)) {
        for (PieceType pt : kPromotions) {
            ml.push(Move::promote(from, to, pt));
        }
    } else {
        ml.push({from, to});
    }
}

// ── Pawns ───────────────────────────────────────────────────────────────────

void gen_pawn_moves(const Position& pos, Color us, MoveList& ml) {
    const Board& board = pos.board();
    const Bitboard empty = ~board.occupied_all();
    const Bitboard enemy = board.occupied(opposite(us));
    const Bitboard promo_rank = (us == Color::White) ? kRank8 : kRank1;
    const Bitboard start_rank = (us == Color::White) ? (kRank1 << 8) : (kRank8 >> 8);
    const bool ep_ok = us == pos.side_to_move() && pos.en_passant() != kNoSquare;

    Bitboard pawns = board.pieces(us, PieceType::Pawn);
    while (pawns) {
        const Square from = pop_lsb(pawns);
        const Bitboard one = pawn_push(us, square_bb(from)) & empty;
        if (one) {
            push_pawn_move(ml, from, lsb(one), promo_rank);
            const Bitboard two = pawn_push(us, one) & empty;
            if (two && test_bit(start_rank, from)) {
                ml.push({from, lsb(two), MoveKind::DoublePush});
            }
        }

        Bitboard caps = pawn_attacks(us, from) & enemy;
        while (caps) {
            push_pawn_move(ml, from, pop_lsb(caps), promo_rank);
        }

        if (ep_ok && test_bit(pawn_attacks(us, from), pos.en_passant())) {
            ml.push({from, pos.en_passant(), MoveKind::EnPassant});
        }
    }
}

// ── Pieces ──────────────────────────────────────────────────────────────────

void gen_piece_moves(const Position& pos, Color us, MoveList& ml) {
    const Board& board = pos.board();
    const Bitboard own = board.occupied(us);
    const Bitboard occ = board.occupied_all();

    for (PieceType pt : {PieceType::Knight, PieceType::Bishop, PieceType::Rook, PieceType::Queen,
                         PieceType::King}) {
        Bitboard pieces = board.pieces(us, pt);
        while (pieces) {
            const Square from = pop_lsb(pieces);
            Bitboard attacks = kEmptyBB;
            switch (pt) {
                case PieceType::Knight:
                    attacks = knight_attacks(from);
                    break;
                case PieceType::Bishop:
                    attacks = bishop_attacks(from, occ);
                    break;
                case PieceType::Rook:
                    attacks = rook_attacks(from, occ);
                    break;
                case PieceType::Queen:
                    attacks = queen_attacks(from, occ);
                    break;
                default:
                    attacks = king_attacks(from);
                    break;
            }
            push_targets(ml, from, attacks & ~own);
        }
    }
}

// ── Castling ────────────────────────────────────────────────────────────────

void gen_castling(const Position& pos, Color us, MoveList& ml) {
    const Color them = opposite(us);
    const Board& board = pos.board();
    const int rank = home_rank(us);
    const Square king_sq = make_square(4, rank);
    const CastlingRights ks = kingside_right(us);
    const CastlingRights qs = queenside_right(us);

    if (!(pos.castling() & (ks | qs)) || board.piece_at(king_sq) != Piece{us, PieceType::King})
        return;
    if (board.is_attacked(king_sq, them))
        return;

    const Piece rook{us, PieceType::Rook};
    if ((pos.castling() & ks) && board.piece_at(make_square(7, rank)) == rook) {
        const Square f_sq = make_square(5, rank);
        const Square g_sq = make_square(6, rank);
        if (board.is_empty(f_sq) && board.is_empty(g_sq) && !board.is_attacked(f_sq, them) &&
            !board.is_attacked(g_sq, them)) {
            ml.push({king_sq, g_sq, MoveKind::CastleKingside});
        }
    }
    if ((pos.castling() & qs) && board.piece_at(make_square(0, rank)) == rook) {
        const Square b_sq = make_square(1, rank);
        const Square c_sq = make_square(2, rank);
        const Square d_sq = make_square(3, rank);
        if (board.is_empty(b_sq) && board.is_empty(c_sq) && board.is_empty(d_sq) &&
            !board.is_attacked(c_sq, them) && !board.is_attacked(d_sq, them)) {
            ml.push({king_sq, c_sq, MoveKind::CastleQueenside});
        }
    }
}

}  // namespace

// ── Public API ──────────────────────────────────────────────────────────────

MoveList pseudo_legal(const Position& pos, Color us) {
    MoveList ml;
    gen_pawn_moves(pos, us, ml);
    gen_piece_moves(pos, us, ml);
    gen_castling(pos, us, ml);
    return ml;
}

bool is_legal(const Position& pos, const Move& m, Color us) {
    // Castling squares were already checked during generation; the rook
    // never shields the king, so only the king's path matters.
    if (m.is_castle())
        return true;

    Board board = pos.board();
    if (m.kind() == MoveKind::EnPassant) {
        board.remove_piece(make_square(file_of(m.to()), rank_of(m.from())));
    } else if (!board.is_empty(m.to())) {
        board.remove_piece(m.to());
    }
    board.move_piece(m.from(), m.to());

    const Square king = board.king_square(us);
    return king == kNoSquare || !board.is_attacked(king, opposite(us));
}

MoveList legal(const Position& pos, Color us) {
    const MoveList pseudo = pseudo_legal(pos, us);
    MoveList result;
    for (const Move& m : pseudo) {
        if (is_legal(pos, m, us)) {
            result.push(m);
        }
    }
    return result;
}

bool has_legal_move(const Position& pos) {
    const Color us = pos.side_to_move();
    const MoveList pseudo = pseudo_legal(pos, us);
    for (const Move& m : pseudo) {
        if (is_legal(pos, m, us))
            return true;
    }
    return false;
}

std::uint64_t perft(Position& pos, int depth) {
    if (depth == 0)
        return 1;

    const MoveList moves = legal(pos);
    if (depth == 1)
        return static_cast<std::uint64_t>(moves.size());

    std::uint64_t nodes = 0;
    for (const Move& m : moves) {
        pos.make_move(m);
        nodes += perft(pos, depth - 1);
        pos.unmake_move(m);
    }
    return nodes;
}

// ── Game status ─────────────────────────────────────────────────────────────

GameStatus status(const Position& pos) {
    if (!has_legal_move(pos)) {
        return pos.is_in_check() ? GameStatus::Checkmate : GameStatus::Stalemate;
    }
    if (pos.has_insufficient_material())
        return GameStatus::InsufficientMaterial;
    if (pos.halfmove_clock() >= 100)
        return GameStatus::FiftyMoveRule;
    if (pos.repetition_count() >= 3)
        return GameStatus::ThreefoldRepetition;
    return GameStatus::Ongoing;
}

std::string_view status_name(GameStatus s) noexcept {
    switch (s) {
        case GameStatus::Ongoing:
            return "ongoing";
        case GameStatus::Checkmate:
            return "checkmate";
        case GameStatus::Stalemate:
            return "stalemate";
        case GameStatus::InsufficientMaterial:
            return "insufficient material";
        case GameStatus::FiftyMoveRule:
            return "fifty-move rule";
        case GameStatus::ThreefoldRepetition:
            return "threefold repetition";
    }
    return "unknown";
}

}  // namespace gambit::chess::movegen
