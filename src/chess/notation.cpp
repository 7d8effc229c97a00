/// @file notation.cpp
/// SAN formatting and parsing, board rendering.

#include <gambit/chess/notation.hpp>

#include <gambit/chess/movegen.hpp>

#include <cctype>
#include <optional>
#include <stdexcept>

namespace gambit::chess::notation {

namespace {

bool is_capture(const Position& pos, const Move& m) noexcept {
    return m.kind() == MoveKind::EnPassant || !pos.board().is_empty(m.to());
}

std::string_view trim(std::string_view sv) noexcept {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\n' ||
                           sv.back() == '\r'))
        sv.remove_suffix(1);
    return sv;
}

std::optional<Move> match_uci(const MoveList& moves, std::string_view text) {
    if (text.size() != 4 && text.size() != 5)
        return std::nullopt;
    for (const Move& m : moves) {
        if (m.uci() == text)
            return m;
    }
    return std::nullopt;
}

std::optional<Move> match_castle(const MoveList& moves, std::string_view text) {
    MoveKind kind;
    if (text == "O-O" || text == "0-0") {
        kind = MoveKind::CastleKingside;
    } else if (text == "O-O-O" || text == "0-0-0") {
        kind = MoveKind::CastleQueenside;
    } else {
        return std::nullopt;
    }
    for (const Move& m : moves) {
        if (m.kind() == kind)
            return m;
    }
    throw std::invalid_argument("Illegal castling: " + std::string(text));
}

Move match_san(const Position& pos, const MoveList& moves, std::string_view text) {
    std::string_view rest = text;

    PieceType piece = PieceType::Pawn;
    if (auto pt = piece_from_letter(rest.front())) {
        piece = *pt;
        rest.remove_prefix(1);
    }

    PieceType promotion = PieceType::None;
    if (piece == PieceType::Pawn && rest.size() >= 2) {
        if (auto pt = piece_from_letter(rest.back()); pt && *pt != PieceType::King) {
            promotion = *pt;
            rest.remove_suffix(1);
            if (!rest.empty() && rest.back() == '=')
                rest.remove_suffix(1);
        }
    }

    std::string hints;
    bool capture = false;
    for (char ch : rest) {
        if (ch == 'x') {
            capture = true;
        } else {
            hints += ch;
        }
    }
    if (hints.size() < 2 || hints.size() > 4) {
        throw std::invalid_argument("Invalid move: " + std::string(text));
    }
    const auto target = parse_square(std::string_view(hints).substr(hints.size() - 2));
    if (!target) {
        throw std::invalid_argument("Invalid move: " + std::string(text));
    }
    const Square to = *target;
    hints.resize(hints.size() - 2);

    int from_file = -1;
    int from_rank = -1;
    for (char ch : hints) {
        if (ch >= 'a' && ch <= 'h') {
            from_file = ch - 'a';
        } else if (ch >= '1' && ch <= '8') {
            from_rank = ch - '1';
        } else {
            throw std::invalid_argument("Invalid move: " + std::string(text));
        }
    }

    std::optional<Move> found;
    for (const Move& m : moves) {
        if (m.to() != to || pos.board().piece_at(m.from()).type != piece)
            continue;
        if (m.is_castle())
            continue;
        if (m.promoted() != promotion)
            continue;
        if (from_file >= 0 && file_of(m.from()) != from_file)
            continue;
        if (from_rank >= 0 && rank_of(m.from()) != from_rank)
            continue;
        if (capture && !is_capture(pos, m))
            continue;
        if (found) {
            throw std::invalid_argument("Ambiguous move: " + std::string(text));
        }
        found = m;
    }
    if (!found) {
        throw std::invalid_argument("Illegal move: " + std::string(text));
    }
    return *found;
}

}  // namespace

// ── SAN ─────────────────────────────────────────────────────────────────────

std::string san(const Position& pos, const Move& m) {
    std::string s;
    if (m.kind() == MoveKind::CastleKingside) {
        s = "O-O";
    } else if (m.kind() == MoveKind::CastleQueenside) {
        s = "O-O-O";
    } else {
        const Board& board = pos.board();
        const PieceType pt = board.piece_at(m.from()).type;
        const bool capture = is_capture(pos, m);

        if (pt == PieceType::Pawn) {
            if (capture)
                s += static_cast<char>('a' + file_of(m.from()));
        } else {
            s += piece_letter(pt);

            // Disambiguate against other pieces of the same type reaching `to`.
            bool clash = false;
            bool same_file = false;
            bool same_rank = false;
            for (const Move& other : movegen::legal(pos)) {
                if (other.to() != m.to() || other.from() == m.from() ||
                    board.piece_at(other.from()).type != pt)
                    continue;
                clash = true;
                same_file |= file_of(other.from()) == file_of(m.from());
                same_rank |= rank_of(other.from()) == rank_of(m.from());
            }
            if (clash) {
                if (!same_file) {
                    s += static_cast<char>('a' + file_of(m.from()));
                } else if (!same_rank) {
                    s += static_cast<char>('1' + rank_of(m.from()));
                } else {
                    s += square_name(m.from());
                }
            }
        }

        if (capture)
            s += 'x';
        s += square_name(m.to());
        if (m.is_promotion()) {
            s += '=';
            s += piece_letter(m.promoted());
        }
    }

    Position after = pos;
    after.make_move(m);
    if (after.is_in_check()) {
        s += movegen::has_legal_move(after) ? '+' : '#';
    }
    return s;
}

// ── Parsing ─────────────────────────────────────────────────────────────────

Move parse_move(const Position& pos, std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        throw std::invalid_argument("Empty move");
    }

    const MoveList moves = movegen::legal(pos);
    if (auto m = match_uci(moves, text))
        return *m;

    while (!text.empty() && (text.back() == '+' || text.back() == '#' || text.back() == '!' ||
                             text.back() == '?'))
        text.remove_suffix(1);
    if (text.empty()) {
        throw std::invalid_argument("Empty move");
    }

    if (auto m = match_castle(moves, text))
        return *m;
    return match_san(pos, moves, text);
}

// ── Console commands ────────────────────────────────────────────────────────

Command parse_command(std::string_view text) {
    std::string word(trim(text));
    for (char& ch : word) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (word == "quit" || word == "q")
        return Command::Quit;
    if (word == "board")
        return Command::Board;
    return Command::None;
}

// ── Rendering ───────────────────────────────────────────────────────────────

std::string render(const Position& pos) {
    std::string out = "  a b c d e f g h\n  ---------------\n";
    for (int rank = 7; rank >= 0; --rank) {
        out += static_cast<char>('1' + rank);
        out += '|';
        for (int file = 0; file < 8; ++file) {
            const Piece p = pos.board().piece_at(make_square(file, rank));
            out += (p == kNoPiece) ? '.' : p.fen_char();
            out += ' ';
        }
        out += '|';
        out += static_cast<char>('1' + rank);
        out += '\n';
    }
    out += "  ---------------\n  a b c d e f g h\n";
    return out;
}

}  // namespace gambit::chess::notation
