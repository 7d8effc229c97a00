/// @file evaluation.cpp
/// Material + piece-square tables + mobility.

#include <gambit/chess/evaluation.hpp>

#include <gambit/chess/movegen.hpp>

#include <array>

namespace gambit::chess::eval {

namespace {

// ── Piece values ────────────────────────────────────────────────────────────

constexpr int kPieceValue[kNumPieceTypes] = {100, 320, 330, 500, 900, 20000};

// ── Piece-square tables ─────────────────────────────────────────────────────
// Laid out as seen from White: first row is rank 8, last row is rank 1.
// A white piece on `sq` reads entry `sq ^ 56`, a black piece reads `sq`.

using Table = std::array<int, 64>;

// clang-format off
constexpr Table kPawnTable = {
     0,  0,  0,  0,  0,  0,  0,  0,
    50, 50, 50, 50, 50, 50, 50, 50,
    10, 10, 20, 30, 30, 20, 10, 10,
     5,  5, 10, 25, 25, 10,  5,  5,
     0,  0,  0, 20, 20,  0,  0,  0,
     5, -5,-10,  0,  0,-10, -5,  5,
     5, 10, 10,-20,-20, 10, 10,  5,
     0,  0,  0,  0,  0,  0,  0,  0,
};

constexpr Table kKnightTable = {
    -50,-40,-30,-30,-30,-30,-40,-50,
    -40,-20,  0,  0,  0,  0,-20,-40,
    -30,  0, 10, 15, 15, 10,  0,-30,
    -30,  5, 15, 20, 20, 15,  5,-30,
    -30,  0, 15, 20, 20, 15,  0,-30,
    -30,  5, 10, 15, 15, 10,  5,-30,
    -40,-20,  0,  5,  5,  0,-20,-40,
    -50,-40,-30,-30,-30,-30,-40,-50,
};

constexpr Table kBishopTable = {
    -20,-10,-10,-10,-10,-10,-10,-20,
    -10,  0,  0,  0,  0,  0,  0,-10,
    -10,  0,  5, 10, 10,  5,  0,-10,
    -10,  5,  5, 10, 10,  5,  5,-10,
    -10,  0, 10, 10, 10, 10,  0,-10,
    -10, 10, 10, 10, 10, 10, 10,-10,
    -10,  5,  0,  0,  0,  0,  5,-10,
    -20,-10,-10,-10,-10,-10,-10,-20,
};

constexpr Table kRookTable = {
     0,  0,  0,  0,  0,  0,  0,  0,
     5, 10, 10, 10, 10, 10, 10,  5,
    -5,  0,  0,  0,  0,  0,  0, -5,
    -5,  0,  0,  0,  0,  0,  0, -5,
    -5,  0,  0,  0,  0,  0,  0, -5,
    -5,  0,  0,  0,  0,  0,  0, -5,
    -5,  0,  0,  0,  0,  0,  0, -5,
     0,  0,  0,  5,  5,  0,  0,  0,
};

constexpr Table kQueenTable = {
    -20,-10,-10, -5, -5,-10,-10,-20,
    -10,  0,  0,  0,  0,  0,  0,-10,
    -10,  0,  5,  5,  5,  5,  0,-10,
     -5,  0,  5,  5,  5,  5,  0, -5,
      0,  0,  5,  5,  5,  5,  0, -5,
    -10,  5,  5,  5,  5,  5,  0,-10,
    -10,  0,  5,  0,  0,  0,  0,-10,
    -20,-10,-10, -5, -5,-10,-10,-20,
};

constexpr Table kKingMiddleTable = {
    -30,-40,-40,-50,-50,-40,-40,-30,
    -30,-40,-40,-50,-50,-40,-40,-30,
    -30,-40,-40,-50,-50,-40,-40,-30,
    -30,-40,-40,-50,-50,-40,-40,-30,
    -20,-30,-30,-40,-40,-30,-30,-20,
    -10,-20,-20,-20,-20,-20,-20,-10,
     20, 20,  0,  0,  0,  0, 20, 20,
     20, 30, 10,  0,  0, 10, 30, 20,
};

constexpr Table kKingEndTable = {
    -50,-40,-30,-20,-20,-30,-40,-50,
    -30,-20,-10,  0,  0,-10,-20,-30,
    -30,-10, 20, 30, 30, 20,-10,-30,
    -30,-10, 30, 40, 40, 30,-10,-30,
    -30,-10, 30, 40, 40, 30,-10,-30,
    -30,-10, 20, 30, 30, 20,-10,-30,
    -30,-30,  0,  0,  0,  0,-30,-30,
    -50,-30,-30,-30,-30,-30,-30,-50,
};
// clang-format on

constexpr const Table* kTables[kNumPieceTypes] = {&kPawnTable, &kKnightTable, &kBishopTable,
                                                  &kRookTable, &kQueenTable, &kKingMiddleTable};

constexpr int kMobilityWeight = 2;
constexpr int kPositionalDivisor = 10;

int table_value(PieceType pt, Color c, Square sq, bool endgame) noexcept {
    const int idx = (c == Color::White) ? (sq ^ 56) : sq;
    const Table& table =
        (pt == PieceType::King && endgame) ? kKingEndTable : *kTables[piece_index(pt)];
    return table[idx];
}

int count(const Position& pos, PieceType pt) noexcept {
    return popcount(pos.board().pieces(Color::White, pt)) +
           popcount(pos.board().pieces(Color::Black, pt));
}

}  // namespace

int piece_value(PieceType pt) noexcept {
    return pt == PieceType::None ? 0 : kPieceValue[piece_index(pt)];
}

int material(const Position& pos) noexcept {
    const Board& board = pos.board();
    int score = 0;
    for (int i = 0; i < kNumPieceTypes; ++i) {
        const auto pt = static_cast<PieceType>(i + 1);
        score += kPieceValue[i] * (popcount(board.pieces(Color::White, pt)) -
                                   popcount(board.pieces(Color::Black, pt)));
    }
    return score;
}

bool is_endgame(const Position& pos) noexcept {
    const int queens = count(pos, PieceType::Queen);
    const int minors = count(pos, PieceType::Knight) + count(pos, PieceType::Bishop);
    return queens == 0 || (queens == 2 && minors <= 2);
}

int positional(const Position& pos) noexcept {
    const Board& board = pos.board();
    const bool endgame = is_endgame(pos);
    int score = 0;
    Bitboard occ = board.occupied_all();
    while (occ) {
        const Square sq = pop_lsb(occ);
        const Piece p = board.piece_at(sq);
        const int v = table_value(p.type, p.color, sq, endgame);
        score += (p.color == Color::White) ? v : -v;
    }
    return score;
}

int mobility(const Position& pos) {
    const auto white = static_cast<int>(movegen::legal(pos, Color::White).size());
    const auto black = static_cast<int>(movegen::legal(pos, Color::Black).size());
    return white - black;
}

int evaluate(const Position& pos) {
    return material(pos) + positional(pos) / kPositionalDivisor + kMobilityWeight * mobility(pos);
}

}  // namespace gambit::chess::eval
