/// @file test_position.cpp
/// Tests for FEN handling, make/unmake, keys and draw queries.

#include <gambit/chess/position.hpp>

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace gambit::chess {
namespace {

const Piece kWhitePawn{Color::White, PieceType::Pawn};
const Piece kWhiteKing{Color::White, PieceType::King};
const Piece kWhiteRook{Color::White, PieceType::Rook};

// ── FEN parsing ─────────────────────────────────────────────────────────────

TEST(PositionTest, StartingFen) {
    EXPECT_EQ(Position::initial().to_fen(), kStartingFen);
    EXPECT_EQ(Position::from_fen(kStartingFen).key(), Position::initial().key());
}

TEST(PositionTest, FenRoundTrip) {
    const std::string fens[] = {
        "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
        "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1",
        "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 12 40",
    };
    for (const auto& fen : fens) {
        EXPECT_EQ(Position::from_fen(fen).to_fen(), fen);
    }
}

TEST(PositionTest, FenMinimalFields) {
    Position pos = Position::from_fen("8/8/8/8/8/8/8/4K2k w - -");
    EXPECT_EQ(pos.side_to_move(), Color::White);
    EXPECT_EQ(pos.castling(), kCastlingNone);
    EXPECT_EQ(pos.en_passant(), kNoSquare);
    EXPECT_EQ(pos.halfmove_clock(), 0);
    EXPECT_EQ(pos.fullmove_number(), 1);
}

TEST(PositionTest, FenInvalidThrows) {
    EXPECT_THROW((void)Position::from_fen(""), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("not a fen"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8 w KQkq -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8/8/8/8/8/4K2k x - -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8/8/8/8/8/4K2k w X -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8/8/8/8/8/4K2k w - e4"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8/8/8/8/8/4K2k w - - -1 1"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8/8/8/8/8/4K3 w - -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("9/8/8/8/8/8/8/4K2k w - -"), std::invalid_argument);
    // Side not to move is in check.
    EXPECT_THROW((void)Position::from_fen("4k3/8/8/8/8/8/8/4K2r b - -"), std::invalid_argument);
}

TEST(PositionTest, InitialPosition) {
    Position pos = Position::initial();
    EXPECT_EQ(pos.side_to_move(), Color::White);
    EXPECT_EQ(pos.castling(), kCastlingAll);
    EXPECT_EQ(pos.board().piece_at(E1), kWhiteKing);
    EXPECT_EQ(pos.board().piece_at(E8), (Piece{Color::Black, PieceType::King}));
    EXPECT_EQ(pos.repetition_count(), 1);
}

// ── Make / unmake ───────────────────────────────────────────────────────────

TEST(PositionTest, DoublePawnPushSetsEnPassant) {
    Position pos = Position::initial();
    const std::string fen = pos.to_fen();
    const auto key = pos.key();
    const Move m{E2, E4, MoveKind::DoublePush};

    pos.make_move(m);
    EXPECT_EQ(pos.en_passant(), E3);
    EXPECT_EQ(pos.board().piece_at(E4), kWhitePawn);
    EXPECT_EQ(pos.side_to_move(), Color::Black);

    pos.unmake_move(m);
    EXPECT_EQ(pos.to_fen(), fen);
    EXPECT_EQ(pos.key(), key);
}

TEST(PositionTest, EnPassantCapture) {
    Position pos =
        Position::from_fen("rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3");
    const std::string fen = pos.to_fen();
    const auto key = pos.key();
    const Move m{E5, D6, MoveKind::EnPassant};

    pos.make_move(m);
    EXPECT_EQ(pos.board().piece_at(D5), kNoPiece);
    EXPECT_EQ(pos.board().piece_at(D6), kWhitePawn);

    pos.unmake_move(m);
    EXPECT_EQ(pos.to_fen(), fen);
    EXPECT_EQ(pos.key(), key);
}

TEST(PositionTest, CastleKingsideMovesRook) {
    Position pos = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    const std::string fen = pos.to_fen();
    const Move m{E1, G1, MoveKind::CastleKingside};

    pos.make_move(m);
    EXPECT_EQ(pos.board().piece_at(G1), kWhiteKing);
    EXPECT_EQ(pos.board().piece_at(F1), kWhiteRook);
    EXPECT_EQ(pos.board().piece_at(H1), kNoPiece);
    EXPECT_EQ(pos.castling() & kWhiteBoth, kCastlingNone);
    EXPECT_EQ(pos.castling() & kBlackBoth, kBlackBoth);

    pos.unmake_move(m);
    EXPECT_EQ(pos.to_fen(), fen);
}

TEST(PositionTest, CastleQueensideMovesRook) {
    Position pos = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    const Move m{E1, C1, MoveKind::CastleQueenside};
    pos.make_move(m);
    EXPECT_EQ(pos.board().piece_at(C1), kWhiteKing);
    EXPECT_EQ(pos.board().piece_at(D1), kWhiteRook);
    EXPECT_EQ(pos.board().piece_at(A1), kNoPiece);
}

TEST(PositionTest, PromotionAndUndo) {
    Position pos = Position::from_fen("8/4P3/8/8/8/8/8/k3K3 w - - 0 1");
    const std::string fen = pos.to_fen();
    const auto key = pos.key();
    const Move m = Move::promote(E7, E8, PieceType::Knight);

    pos.make_move(m);
    EXPECT_EQ(pos.board().piece_at(E8), (Piece{Color::White, PieceType::Knight}));
    EXPECT_EQ(pos.board().piece_at(E7), kNoPiece);

    pos.unmake_move(m);
    EXPECT_EQ(pos.to_fen(), fen);
    EXPECT_EQ(pos.key(), key);
}

TEST(PositionTest, CaptureOnRookSquareRemovesRight) {
    Position pos = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    pos.make_move({H1, H8});
    EXPECT_EQ(pos.castling() & kBlackKingside, kCastlingNone);
    EXPECT_EQ(pos.castling() & kBlackQueenside, kBlackQueenside);
    EXPECT_EQ(pos.castling() & kWhiteKingside, kCastlingNone);
    EXPECT_EQ(pos.halfmove_clock(), 0);
}

TEST(PositionTest, IncrementalKeyMatchesFreshKey) {
    Position pos = Position::initial();
    const Move line[] = {{E2, E4, MoveKind::DoublePush}, {D7, D5, MoveKind::DoublePush},
                         {E4, D5}, {G8, F6}, {F1, B5}};
    for (const Move& m : line) {
        pos.make_move(m);
        EXPECT_EQ(pos.key(), Position::from_fen(pos.to_fen()).key()) << pos.to_fen();
    }
    for (int i = 4; i >= 0; --i) pos.unmake_move(line[i]);
    EXPECT_EQ(pos.to_fen(), kStartingFen);
    EXPECT_EQ(pos.key(), Position::initial().key());
}

TEST(PositionTest, ClocksAdvance) {
    Position pos = Position::initial();
    pos.make_move({G1, F3});
    EXPECT_EQ(pos.halfmove_clock(), 1);
    EXPECT_EQ(pos.fullmove_number(), 1);
    pos.make_move({G8, F6});
    EXPECT_EQ(pos.halfmove_clock(), 2);
    EXPECT_EQ(pos.fullmove_number(), 2);
    pos.make_move({E2, E3});
    EXPECT_EQ(pos.halfmove_clock(), 0);
}

// ── Queries ─────────────────────────────────────────────────────────────────

TEST(PositionTest, CheckDetection) {
    EXPECT_FALSE(Position::initial().is_in_check());
    Position pos =
        Position::from_fen("r1bqkb1r/pppp1Qpp/2n2n2/4p3/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 0 4");
    EXPECT_TRUE(pos.is_in_check());
    EXPECT_TRUE(pos.is_in_check(Color::Black));
    EXPECT_FALSE(pos.is_in_check(Color::White));
    EXPECT_TRUE(pos.is_square_attacked(E8, Color::White));
}

TEST(PositionTest, RepetitionCount) {
    Position pos = Position::initial();
    const Move shuffle[] = {{G1, F3}, {G8, F6}, {F3, G1}, {F6, G8}};
    for (const Move& m : shuffle) pos.make_move(m);
    EXPECT_EQ(pos.repetition_count(), 2);
    for (const Move& m : shuffle) pos.make_move(m);
    EXPECT_EQ(pos.repetition_count(), 3);
    pos.unmake_move(shuffle[3]);
    EXPECT_EQ(pos.repetition_count(), 2);
}

TEST(PositionTest, InsufficientMaterial) {
    EXPECT_TRUE(Position::from_fen("8/8/8/4k3/8/8/8/4K3 w - -").has_insufficient_material());
    EXPECT_TRUE(Position::from_fen("8/8/8/4k3/8/8/8/4KN2 w - -").has_insufficient_material());
    EXPECT_TRUE(Position::from_fen("8/8/8/4k3/8/8/8/3BK3 b - -").has_insufficient_material());
    // Bishops on the same colour (c1 and f4 are both dark).
    EXPECT_TRUE(Position::from_fen("8/8/8/4k3/5b2/8/8/2B1K3 w - -").has_insufficient_material());
    // Bishops on opposite colours can still mate in theory.
    EXPECT_FALSE(Position::from_fen("8/8/8/4k3/4b3/8/8/2B1K3 w - -").has_insufficient_material());
    EXPECT_FALSE(Position::from_fen("8/8/8/4k3/8/8/4P3/4K3 w - -").has_insufficient_material());
    EXPECT_FALSE(Position::from_fen("8/8/8/4k3/8/8/8/3RK3 w - -").has_insufficient_material());
}

// ── Mirroring ───────────────────────────────────────────────────────────────

TEST(PositionTest, MirroredSwapsColoursAndRanks) {
    Position pos =
        Position::from_fen("r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K1R1 b Qkq - 3 9");
    const Position m = pos.mirrored();
    EXPECT_EQ(m.to_fen(), "r3k1r1/pppbbppp/2n2q1P/1P2p3/3pn3/BN2PNP1/P1PPQPB1/R3K2R w KQq - 3 9");
    EXPECT_EQ(m.mirrored().to_fen(), pos.to_fen());
}

TEST(PositionTest, MirroredMapsEnPassant) {
    Position pos =
        Position::from_fen("rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
    EXPECT_EQ(pos.mirrored().en_passant(), E6);
    EXPECT_EQ(pos.mirrored().side_to_move(), Color::White);
}

}  // namespace
}  // namespace gambit::chess
