/// @file test_perft.cpp
/// Perft validation of the move generator against published node counts.
///
/// If perft matches, make_move / unmake_move and legal move generation
/// agree with the rules, including castling, en passant and promotions.

#include <gambit/chess/movegen.hpp>
#include <gambit/chess/position.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

namespace gambit::chess {
namespace {

std::uint64_t perft_fen(const char* fen, int depth) {
    auto pos = Position::from_fen(fen);
    return movegen::perft(pos, depth);
}

// ── Starting position ───────────────────────────────────────────────────────

TEST(Perft, StartingPosition) {
    auto pos = Position::initial();
    EXPECT_EQ(movegen::perft(pos, 1), 20ULL);
    EXPECT_EQ(movegen::perft(pos, 2), 400ULL);
    EXPECT_EQ(movegen::perft(pos, 3), 8902ULL);
}

TEST(Perft, StartingDepth4) {
    auto pos = Position::initial();
    EXPECT_EQ(movegen::perft(pos, 4), 197281ULL);
}

TEST(Perft, LeavesPositionUnchanged) {
    auto pos = Position::initial();
    const std::uint64_t key = pos.key();
    (void)movegen::perft(pos, 3);
    EXPECT_EQ(pos.key(), key);
    EXPECT_EQ(pos.to_fen(), std::string(kStartingFen));
}

// ── Kiwipete ────────────────────────────────────────────────────────────────
// Castling both ways, en passant, promotions and pins in one position.

static constexpr const char* kKiwipete =
    "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";

TEST(Perft, Kiwipete) {
    EXPECT_EQ(perft_fen(kKiwipete, 1), 48ULL);
    EXPECT_EQ(perft_fen(kKiwipete, 2), 2039ULL);
    EXPECT_EQ(perft_fen(kKiwipete, 3), 97862ULL);
}

// ── Position 3 ──────────────────────────────────────────────────────────────
// Rook endgame with en passant discovered checks along the rank.

static constexpr const char* kPosition3 = "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1";

TEST(Perft, Position3) {
    EXPECT_EQ(perft_fen(kPosition3, 1), 14ULL);
    EXPECT_EQ(perft_fen(kPosition3, 2), 191ULL);
    EXPECT_EQ(perft_fen(kPosition3, 3), 2812ULL);
    EXPECT_EQ(perft_fen(kPosition3, 4), 43238ULL);
}

// ── Position 4 ──────────────────────────────────────────────────────────────

static constexpr const char* kPosition4 =
    "r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1";

TEST(Perft, Position4) {
    EXPECT_EQ(perft_fen(kPosition4, 1), 6ULL);
    EXPECT_EQ(perft_fen(kPosition4, 2), 264ULL);
    EXPECT_EQ(perft_fen(kPosition4, 3), 9467ULL);
}

// ── Position 5 ──────────────────────────────────────────────────────────────

static constexpr const char* kPosition5 =
    "rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8";

TEST(Perft, Position5) {
    EXPECT_EQ(perft_fen(kPosition5, 1), 44ULL);
    EXPECT_EQ(perft_fen(kPosition5, 2), 1486ULL);
    EXPECT_EQ(perft_fen(kPosition5, 3), 62379ULL);
}

// ── Position 6 ──────────────────────────────────────────────────────────────

static constexpr const char* kPosition6 =
    "r4rk1/1pp1qppp/p1np1n2/2b1p1B1/2B1P1b1/3P1N1P/PPP1NPP1/R2Q1RK1 w - - 0 10";

TEST(Perft, Position6) {
    EXPECT_EQ(perft_fen(kPosition6, 1), 42ULL);
    EXPECT_EQ(perft_fen(kPosition6, 2), 1892ULL);
    EXPECT_EQ(perft_fen(kPosition6, 3), 76031ULL);
}

// ── Mirrored positions ──────────────────────────────────────────────────────
// Colour-flipped positions must produce identical counts.

TEST(Perft, MirroredKiwipete) {
    auto pos = Position::from_fen(kKiwipete).mirrored();
    EXPECT_EQ(movegen::perft(pos, 2), 2039ULL);
}

TEST(Perft, MirroredPosition4) {
    auto pos = Position::from_fen(kPosition4).mirrored();
    EXPECT_EQ(movegen::perft(pos, 3), 9467ULL);
}

}  // namespace
}  // namespace gambit::chess
