/// @file test_notation.cpp
/// Tests for SAN output, move parsing and the board diagram.

#include <gambit/chess/movegen.hpp>
#include <gambit/chess/notation.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace gambit::chess {
namespace {

std::string san_of(const char* fen, const std::string& uci) {
    const auto pos = Position::from_fen(fen);
    for (const Move& m : movegen::legal(pos)) {
        if (m.uci() == uci)
            return notation::san(pos, m);
    }
    ADD_FAILURE() << "no legal move " << uci;
    return {};
}

// ── SAN ─────────────────────────────────────────────────────────────────────

TEST(San, PawnAndPieceMoves) {
    const char* start = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
    EXPECT_EQ(san_of(start, "e2e4"), "e4");
    EXPECT_EQ(san_of(start, "g1f3"), "Nf3");
}

TEST(San, Captures) {
    EXPECT_EQ(san_of("4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1", "e4d5"), "exd5");
    EXPECT_EQ(san_of("4k3/8/8/8/8/8/r7/Q3K3 w - - 0 1", "a1a2"), "Qxa2");
    EXPECT_EQ(san_of("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 1", "e5d6"), "exd6");
}

TEST(San, Castling) {
    const char* fen = "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1";
    EXPECT_EQ(san_of(fen, "e1g1"), "O-O");
    EXPECT_EQ(san_of(fen, "e1c1"), "O-O-O");
}

TEST(San, PromotionWithCheck) {
    EXPECT_EQ(san_of("8/P6k/8/8/8/8/8/K7 w - - 0 1", "a7a8q"), "a8=Q");
    EXPECT_EQ(san_of("8/P7/8/8/8/8/8/K6k w - - 0 1", "a7a8q"), "a8=Q+");
    EXPECT_EQ(san_of("1r5k/P7/8/8/8/8/8/K7 w - - 0 1", "a7b8n"), "axb8=N");
}

TEST(San, CheckAndMate) {
    EXPECT_EQ(san_of("4k3/8/8/8/8/8/8/R3K3 w - - 0 1", "a1a8"), "Ra8+");
    EXPECT_EQ(san_of("6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1", "a1a8"), "Ra8#");
}

TEST(San, DisambiguateByFile) {
    // Knights on b1 and f1 can both reach d2.
    EXPECT_EQ(san_of("4k3/8/8/8/8/8/8/1N2KN2 w - - 0 1", "b1d2"), "Nbd2");
}

TEST(San, DisambiguateByRank) {
    // Rooks on a1 and a5 can both reach a3.
    EXPECT_EQ(san_of("4k3/8/8/R7/8/8/8/R3K3 w - - 0 1", "a1a3"), "R1a3");
}

TEST(San, DisambiguateBySquare) {
    // Queens on a1, a3 and c1 all reach b2.
    EXPECT_EQ(san_of("4k3/8/8/8/8/Q7/8/Q1Q1K3 w - - 0 1", "a1b2"), "Qa1b2");
}

// ── Parsing ─────────────────────────────────────────────────────────────────

TEST(ParseMove, Uci) {
    const auto pos = Position::initial();
    const Move m = notation::parse_move(pos, "e2e4");
    EXPECT_EQ(m.from(), E2);
    EXPECT_EQ(m.to(), E4);
    EXPECT_EQ(m.kind(), MoveKind::DoublePush);
}

TEST(ParseMove, SanWithSuffixesAndSpaces) {
    const auto pos = Position::initial();
    EXPECT_EQ(notation::parse_move(pos, "  Nf3 ").uci(), "g1f3");
    EXPECT_EQ(notation::parse_move(pos, "e4!?").uci(), "e2e4");

    const auto mate = Position::from_fen("6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1");
    EXPECT_EQ(notation::parse_move(mate, "Ra8#").uci(), "a1a8");
}

TEST(ParseMove, Castling) {
    const auto pos = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    EXPECT_EQ(notation::parse_move(pos, "O-O").kind(), MoveKind::CastleKingside);
    EXPECT_EQ(notation::parse_move(pos, "0-0-0").kind(), MoveKind::CastleQueenside);
    EXPECT_EQ(notation::parse_move(pos, "e1g1").kind(), MoveKind::CastleKingside);

    const auto no_rights = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w kq - 0 1");
    EXPECT_THROW((void)notation::parse_move(no_rights, "O-O"), std::invalid_argument);
}

TEST(ParseMove, Promotion) {
    const auto pos = Position::from_fen("1r5k/P7/8/8/8/8/8/K7 w - - 0 1");
    EXPECT_EQ(notation::parse_move(pos, "a8=Q").uci(), "a7a8q");
    EXPECT_EQ(notation::parse_move(pos, "a8N").uci(), "a7a8n");
    EXPECT_EQ(notation::parse_move(pos, "axb8=R").uci(), "a7b8r");
    EXPECT_EQ(notation::parse_move(pos, "a7b8b").uci(), "a7b8b");
}

TEST(ParseMove, Disambiguation) {
    const auto pos = Position::from_fen("4k3/8/8/8/8/8/8/1N2KN2 w - - 0 1");
    EXPECT_EQ(notation::parse_move(pos, "Nbd2").uci(), "b1d2");
    EXPECT_EQ(notation::parse_move(pos, "Nfd2").uci(), "f1d2");
    EXPECT_THROW((void)notation::parse_move(pos, "Nd2"), std::invalid_argument);
}

TEST(ParseMove, CaptureMarker) {
    const auto pos = Position::from_fen("4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1");
    EXPECT_EQ(notation::parse_move(pos, "exd5").uci(), "e4d5");
    EXPECT_THROW((void)notation::parse_move(pos, "exe5"), std::invalid_argument);
}

TEST(ParseMove, RejectsBadInput) {
    const auto pos = Position::initial();
    EXPECT_THROW((void)notation::parse_move(pos, ""), std::invalid_argument);
    EXPECT_THROW((void)notation::parse_move(pos, "   "), std::invalid_argument);
    EXPECT_THROW((void)notation::parse_move(pos, "e2e5"), std::invalid_argument);
    EXPECT_THROW((void)notation::parse_move(pos, "Ke2"), std::invalid_argument);
    EXPECT_THROW((void)notation::parse_move(pos, "Zz9"), std::invalid_argument);
    EXPECT_THROW((void)notation::parse_move(pos, "hello"), std::invalid_argument);
}

TEST(ParseMove, SanRoundTripsForEveryLegalMove) {
    const auto pos = Position::from_fen(
        "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
    for (const Move& m : movegen::legal(pos)) {
        const std::string text = notation::san(pos, m);
        EXPECT_EQ(notation::parse_move(pos, text), m) << text;
    }
}

// ── Console commands ────────────────────────────────────────────────────────

TEST(ParseCommand, IgnoresCaseAndWhitespace) {
    EXPECT_EQ(notation::parse_command("quit"), notation::Command::Quit);
    EXPECT_EQ(notation::parse_command("Quit"), notation::Command::Quit);
    EXPECT_EQ(notation::parse_command("  Q\r"), notation::Command::Quit);
    EXPECT_EQ(notation::parse_command("board "), notation::Command::Board);
    EXPECT_EQ(notation::parse_command("BOARD"), notation::Command::Board);
}

TEST(ParseCommand, MovesAreNotCommands) {
    EXPECT_EQ(notation::parse_command("e2e4"), notation::Command::None);
    EXPECT_EQ(notation::parse_command("Qh5"), notation::Command::None);
    EXPECT_EQ(notation::parse_command(""), notation::Command::None);
    EXPECT_EQ(notation::parse_command("quits"), notation::Command::None);
}

// ── Rendering ───────────────────────────────────────────────────────────────

TEST(Render, InitialPosition) {
    const std::string board = notation::render(Position::initial());
    const std::string expected =
        "  a b c d e f g h\n"
        "  ---------------\n"
        "8|r n b q k b n r |8\n"
        "7|p p p p p p p p |7\n"
        "6|. . . . . . . . |6\n"
        "5|. . . . . . . . |5\n"
        "4|. . . . . . . . |4\n"
        "3|. . . . . . . . |3\n"
        "2|P P P P P P P P |2\n"
        "1|R N B Q K B N R |1\n"
        "  ---------------\n"
        "  a b c d e f g h\n";
    EXPECT_EQ(board, expected);
}

}  // namespace
}  // namespace gambit::chess
