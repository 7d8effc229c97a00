/// @file test_board.cpp
/// Tests for Piece and Board: initial layout, edits and attack queries.

#include <gambit/chess/board.hpp>

#include <gtest/gtest.h>

namespace gambit::chess {
namespace {

constexpr Piece kWhiteRook{Color::White, PieceType::Rook};
constexpr Piece kWhiteKnight{Color::White, PieceType::Knight};
constexpr Piece kBlackQueen{Color::Black, PieceType::Queen};
constexpr Piece kBlackPawn{Color::Black, PieceType::Pawn};

// ── Piece ───────────────────────────────────────────────────────────────────

TEST(Piece, FenChar) {
    EXPECT_EQ(kWhiteRook.fen_char(), 'R');
    EXPECT_EQ(kBlackQueen.fen_char(), 'q');
    EXPECT_EQ(kNoPiece.fen_char(), ' ');
}

TEST(Piece, FromFenChar) {
    EXPECT_EQ(Piece::from_fen_char('N'), kWhiteKnight);
    EXPECT_EQ(Piece::from_fen_char('p'), kBlackPawn);
    EXPECT_EQ(Piece::from_fen_char('x').type, PieceType::None);
}

// ── Board::initial() ────────────────────────────────────────────────────────

TEST(Board, InitialBackRanks) {
    const Board b = Board::initial();
    constexpr PieceType kOrder[8] = {PieceType::Rook, PieceType::Knight, PieceType::Bishop,
                                     PieceType::Queen, PieceType::King, PieceType::Bishop,
                                     PieceType::Knight, PieceType::Rook};
    for (int f = 0; f < 8; ++f) {
        EXPECT_EQ(b.piece_at(make_square(f, 0)), (Piece{Color::White, kOrder[f]}));
        EXPECT_EQ(b.piece_at(make_square(f, 1)), (Piece{Color::White, PieceType::Pawn}));
        EXPECT_EQ(b.piece_at(make_square(f, 6)), (Piece{Color::Black, PieceType::Pawn}));
        EXPECT_EQ(b.piece_at(make_square(f, 7)), (Piece{Color::Black, kOrder[f]}));
    }
}

TEST(Board, InitialMiddleEmpty) {
    const Board b = Board::initial();
    for (int r = 2; r <= 5; ++r) {
        for (int f = 0; f < 8; ++f) {
            EXPECT_TRUE(b.is_empty(make_square(f, r))) << square_name(make_square(f, r));
        }
    }
}

TEST(Board, InitialOccupancyAndKings) {
    const Board b = Board::initial();
    EXPECT_EQ(popcount(b.occupied(Color::White)), 16);
    EXPECT_EQ(popcount(b.occupied(Color::Black)), 16);
    EXPECT_EQ(popcount(b.occupied_all()), 32);
    EXPECT_EQ(b.king_square(Color::White), E1);
    EXPECT_EQ(b.king_square(Color::Black), E8);
    EXPECT_EQ(b.pieces(Color::White, PieceType::Pawn), 0xFF00ULL);
}

// ── Editing ─────────────────────────────────────────────────────────────────

TEST(Board, PutRemoveMove) {
    Board b;
    b.put_piece(D4, kWhiteKnight);
    EXPECT_EQ(b.piece_at(D4), kWhiteKnight);
    EXPECT_TRUE(test_bit(b.pieces(Color::White, PieceType::Knight), D4));
    EXPECT_TRUE(test_bit(b.occupied(Color::White), D4));

    b.move_piece(D4, F5);
    EXPECT_TRUE(b.is_empty(D4));
    EXPECT_EQ(b.piece_at(F5), kWhiteKnight);
    EXPECT_EQ(b.pieces(Color::White, PieceType::Knight), square_bb(F5));

    b.remove_piece(F5);
    EXPECT_TRUE(b.is_empty(F5));
    EXPECT_EQ(b.occupied_all(), kEmptyBB);
}

TEST(Board, MissingKingReportsNoSquare) {
    Board b;
    EXPECT_EQ(b.king_square(Color::White), kNoSquare);
}

TEST(Board, MailboxMatchesBitboards) {
    const Board b = Board::initial();
    for (int sq = 0; sq < 64; ++sq) {
        const auto s = static_cast<Square>(sq);
        const Piece p = b.piece_at(s);
        if (p == kNoPiece) {
            EXPECT_FALSE(test_bit(b.occupied_all(), s));
        } else {
            EXPECT_TRUE(test_bit(b.pieces(p.color, p.type), s));
        }
    }
}

// ── Attacks ─────────────────────────────────────────────────────────────────

TEST(Board, IsAttackedInitial) {
    const Board b = Board::initial();
    EXPECT_TRUE(b.is_attacked(F3, Color::White));   // pawn and knight
    EXPECT_TRUE(b.is_attacked(D2, Color::White));   // defended by pieces
    EXPECT_FALSE(b.is_attacked(E4, Color::White));
    EXPECT_TRUE(b.is_attacked(F6, Color::Black));
    EXPECT_FALSE(b.is_attacked(E5, Color::Black));
}

TEST(Board, IsAttackedBySliders) {
    Board b;
    b.put_piece(A1, kWhiteRook);
    b.put_piece(H8, kBlackQueen);
    b.put_piece(A5, kBlackPawn);
    EXPECT_TRUE(b.is_attacked(A4, Color::White));
    EXPECT_TRUE(b.is_attacked(A5, Color::White));
    EXPECT_FALSE(b.is_attacked(A6, Color::White));  // behind the pawn
    EXPECT_TRUE(b.is_attacked(A1, Color::Black));   // long diagonal
    EXPECT_TRUE(b.is_attacked(B4, Color::Black));   // pawn on a5 attacks b4
    EXPECT_FALSE(b.is_attacked(B6, Color::Black));
}

}  // namespace
}  // namespace gambit::chess
