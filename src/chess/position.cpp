/// @file position.cpp
/// Position implementation: constructors, FEN, make/unmake, draw queries.

#include <gambit/chess/position.hpp>

#include <gambit/chess/zobrist.hpp>

#include <algorithm>
#include <charconv>
#include <stdexcept>
#include <string>
#include <vector>

namespace gambit::chess {

namespace {

/// Split a string_view on runs of spaces.
std::vector<std::string_view> split_spaces(std::string_view sv) {
    std::vector<std::string_view> parts;
    std::size_t i = 0;
    while (i < sv.size()) {
        while (i < sv.size() && sv[i] == ' ') ++i;
        if (i >= sv.size())
            break;
        std::size_t start = i;
        while (i < sv.size() && sv[i] != ' ') ++i;
        parts.push_back(sv.substr(start, i - start));
    }
    return parts;
}

int parse_int(std::string_view sv, int min_val) {
    int val = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), val);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::invalid_argument("Invalid integer in FEN: " + std::string(sv));
    }
    if (val < min_val) {
        throw std::invalid_argument("Integer out of range in FEN: " + std::string(sv));
    }
    return val;
}

Board parse_placement(std::string_view placement, std::string_view fen) {
    Board board;
    int rank = 7;
    int file = 0;
    for (char ch : placement) {
        if (ch == '/') {
            if (file != 8 || rank == 0) {
                throw std::invalid_argument("Invalid FEN board placement: " + std::string(fen));
            }
            --rank;
            file = 0;
        } else if (ch >= '1' && ch <= '8') {
            file += ch - '0';
            if (file > 8) {
                throw std::invalid_argument("Invalid FEN rank width: " + std::string(fen));
            }
        } else {
            const Piece p = Piece::from_fen_char(ch);
            if (p.type == PieceType::None) {
                throw std::invalid_argument(std::string("Invalid FEN piece char: ") + ch);
            }
            if (file >= 8) {
                throw std::invalid_argument("Invalid FEN rank width: " + std::string(fen));
            }
            board.put_piece(make_square(file, rank), p);
            ++file;
        }
    }
    if (rank != 0 || file != 8) {
        throw std::invalid_argument("Invalid FEN board placement: " + std::string(fen));
    }
    for (Color c : {Color::White, Color::Black}) {
        if (popcount(board.pieces(c, PieceType::King)) != 1) {
            throw std::invalid_argument("FEN needs exactly one king per side: " +
                                        std::string(fen));
        }
    }
    return board;
}

}  // namespace

// ── Constructors ────────────────────────────────────────────────────────────

Position::Position(Board board, Color side, CastlingRights castling, Square ep, int halfmove,
                   int fullmove)
    : board_(board),
      side_to_move_(side),
      castling_(castling),
      en_passant_(ep),
      halfmove_clock_(halfmove),
      fullmove_number_(fullmove) {
    compute_key();
}

Position::Position() {
    compute_key();
}

// ── Factory ─────────────────────────────────────────────────────────────────

Position Position::initial() {
    return Position(Board::initial(), Color::White, kCastlingAll, kNoSquare, 0, 1);
}

Position Position::from_fen(std::string_view fen) {
    const auto parts = split_spaces(fen);
    if (parts.size() < 4 || parts.size() > 6) {
        throw std::invalid_argument("Invalid FEN (need 4-6 fields): " + std::string(fen));
    }

    Board board = parse_placement(parts[0], fen);

    Color side = Color::White;
    if (parts[1] == "b") {
        side = Color::Black;
    } else if (parts[1] != "w") {
        throw std::invalid_argument("Invalid FEN side-to-move: " + std::string(parts[1]));
    }

    CastlingRights castling = kCastlingNone;
    if (parts[2] != "-") {
        for (char ch : parts[2]) {
            switch (ch) {
                case 'K':
                    castling |= kWhiteKingside;
                    break;
                case 'Q':
                    castling |= kWhiteQueenside;
                    break;
                case 'k':
                    castling |= kBlackKingside;
                    break;
                case 'q':
                    castling |= kBlackQueenside;
                    break;
                default:
                    throw std::invalid_argument(std::string("Invalid castling char in FEN: ") +
                                                ch);
            }
        }
    }

    Square ep = kNoSquare;
    if (parts[3] != "-") {
        const auto parsed = parse_square(parts[3]);
        if (!parsed || (rank_of(*parsed) != 2 && rank_of(*parsed) != 5)) {
            throw std::invalid_argument("Invalid FEN en-passant square: " +
                                        std::string(parts[3]));
        }
        ep = *parsed;
    }

    const int halfmove = (parts.size() > 4) ? parse_int(parts[4], 0) : 0;
    const int fullmove = (parts.size() > 5) ? parse_int(parts[5], 1) : 1;

    Position pos(board, side, castling, ep, halfmove, fullmove);
    if (pos.is_in_check(opposite(side))) {
        throw std::invalid_argument("FEN side not to move is in check: " + std::string(fen));
    }
    return pos;
}

// ── Serialization ───────────────────────────────────────────────────────────

std::string Position::to_fen() const {
    std::string fen;
    fen.reserve(90);

    for (int rank = 7; rank >= 0; --rank) {
        int empty = 0;
        for (int file = 0; file < 8; ++file) {
            const Piece p = board_.piece_at(make_square(file, rank));
            if (p == kNoPiece) {
                ++empty;
                continue;
            }
            if (empty > 0) {
                fen += static_cast<char>('0' + empty);
                empty = 0;
            }
            fen += p.fen_char();
        }
        if (empty > 0)
            fen += static_cast<char>('0' + empty);
        if (rank > 0)
            fen += '/';
    }

    fen += (side_to_move_ == Color::White) ? " w " : " b ";

    if (castling_ == kCastlingNone) {
        fen += '-';
    } else {
        if (castling_ & kWhiteKingside) fen += 'K';
        if (castling_ & kWhiteQueenside) fen += 'Q';
        if (castling_ & kBlackKingside) fen += 'k';
        if (castling_ & kBlackQueenside) fen += 'q';
    }

    fen += ' ';
    fen += (en_passant_ == kNoSquare) ? "-" : square_name(en_passant_);
    fen += ' ' + std::to_string(halfmove_clock_) + ' ' + std::to_string(fullmove_number_);
    return fen;
}

Position Position::mirrored() const {
    Board board;
    for (int sq = 0; sq < 64; ++sq) {
        const Piece p = board_.piece_at(static_cast<Square>(sq));
        if (p != kNoPiece) {
            board.put_piece(flip_rank(static_cast<Square>(sq)), {opposite(p.color), p.type});
        }
    }
    // White rights live in the low two bits, black rights in the next two.
    const auto swapped = static_cast<CastlingRights>(((castling_ & kWhiteBoth) << 2) |
                                                     ((castling_ & kBlackBoth) >> 2));
    const Square ep = (en_passant_ == kNoSquare) ? kNoSquare : flip_rank(en_passant_);
    return Position(board, opposite(side_to_move_), swapped, ep, halfmove_clock_,
                    fullmove_number_);
}

// ── Move operations ─────────────────────────────────────────────────────────

void Position::make_move(Move m) {
    const Piece piece = board_.piece_at(m.from());

    Square capture_sq = m.to();
    if (m.kind() == MoveKind::EnPassant) {
        capture_sq = make_square(file_of(m.to()), rank_of(m.from()));
    }
    const Piece captured = board_.piece_at(capture_sq);

    history_.push_back({castling_, en_passant_, halfmove_clock_, captured, key_});

    if (captured != kNoPiece) {
        remove(capture_sq);
    }

    remove(m.from());
    put(m.to(), m.is_promotion() ? Piece{piece.color, m.promoted()} : piece);

    if (m.is_castle()) {
        const int r = rank_of(m.from());
        const bool king_side = (m.kind() == MoveKind::CastleKingside);
        const Square rook_from = make_square(king_side ? 7 : 0, r);
        const Square rook_to = make_square(king_side ? 5 : 3, r);
        const Piece rook = board_.piece_at(rook_from);
        remove(rook_from);
        put(rook_to, rook);
    }

    if (m.kind() == MoveKind::DoublePush) {
        set_en_passant(
            make_square(file_of(m.from()), (rank_of(m.from()) + rank_of(m.to())) / 2));
    } else {
        set_en_passant(kNoSquare);
    }

    set_castling(castling_ & detail::kCastleMask[m.from()] & detail::kCastleMask[m.to()]);

    if (piece.type == PieceType::Pawn || captured != kNoPiece) {
        halfmove_clock_ = 0;
    } else {
        ++halfmove_clock_;
    }
    if (side_to_move_ == Color::Black) {
        ++fullmove_number_;
    }

    side_to_move_ = opposite(side_to_move_);
    key_ ^= zobrist::side_to_move_key();
    key_history_.push_back(key_);
}

void Position::unmake_move(Move m) {
    key_history_.pop_back();
    const UndoInfo undo = history_.back();
    history_.pop_back();

    side_to_move_ = opposite(side_to_move_);
    if (side_to_move_ == Color::Black) {
        --fullmove_number_;
    }

    // Board changes are replayed in reverse; the key is restored wholesale.
    Piece moved = board_.piece_at(m.to());
    if (m.is_promotion()) {
        moved = Piece{moved.color, PieceType::Pawn};
    }
    board_.remove_piece(m.to());
    board_.put_piece(m.from(), moved);

    if (undo.captured != kNoPiece) {
        const Square capture_sq = (m.kind() == MoveKind::EnPassant)
                                      ? make_square(file_of(m.to()), rank_of(m.from()))
                                      : m.to();
        board_.put_piece(capture_sq, undo.captured);
    }

    if (m.is_castle()) {
        const int r = rank_of(m.from());
        const bool king_side = (m.kind() == MoveKind::CastleKingside);
        board_.move_piece(make_square(king_side ? 5 : 3, r), make_square(king_side ? 7 : 0, r));
    }

    castling_ = undo.castling;
    en_passant_ = undo.en_passant;
    halfmove_clock_ = undo.halfmove_clock;
    key_ = undo.key;
}

// ── Queries ─────────────────────────────────────────────────────────────────

bool Position::is_in_check(Color c) const noexcept {
    const Square king = board_.king_square(c);
    return king != kNoSquare && board_.is_attacked(king, opposite(c));
}

int Position::repetition_count() const {
    return static_cast<int>(std::count(key_history_.begin(), key_history_.end(), key_));
}

bool Position::has_insufficient_material() const noexcept {
    const Bitboard all = board_.occupied_all();
    const int total = popcount(all);

    if (total == 2)
        return true;

    if (total == 3) {
        for (Color c : {Color::White, Color::Black}) {
            if (board_.pieces(c, PieceType::Knight) || board_.pieces(c, PieceType::Bishop))
                return true;
        }
        return false;
    }

    if (total == 4) {
        const Bitboard wb = board_.pieces(Color::White, PieceType::Bishop);
        const Bitboard bb = board_.pieces(Color::Black, PieceType::Bishop);
        if (wb && bb) {
            return ((wb & kLightSquares) != 0) == ((bb & kLightSquares) != 0);
        }
    }
    return false;
}

// ── Private helpers ─────────────────────────────────────────────────────────

void Position::compute_key() {
    key_ = zobrist::castling_key(castling_);
    if (side_to_move_ == Color::Black) {
        key_ ^= zobrist::side_to_move_key();
    }
    if (en_passant_ != kNoSquare) {
        key_ ^= zobrist::en_passant_key(en_passant_);
    }
    for (int sq = 0; sq < 64; ++sq) {
        const Piece p = board_.piece_at(static_cast<Square>(sq));
        if (p != kNoPiece) {
            key_ ^= zobrist::piece_key(p.color, p.type, static_cast<Square>(sq));
        }
    }
    history_.clear();
    key_history_.assign(1, key_);
}

void Position::put(Square sq, Piece p) {
    board_.put_piece(sq, p);
    key_ ^= zobrist::piece_key(p.color, p.type, sq);
}

void Position::remove(Square sq) {
    const Piece p = board_.piece_at(sq);
    key_ ^= zobrist::piece_key(p.color, p.type, sq);
    board_.remove_piece(sq);
}

void Position::set_castling(CastlingRights cr) {
    if (cr == castling_)
        return;
    key_ ^= zobrist::castling_key(castling_);
    castling_ = cr;
    key_ ^= zobrist::castling_key(castling_);
}

void Position::set_en_passant(Square ep) {
    if (ep == en_passant_)
        return;
    if (en_passant_ != kNoSquare) {
        key_ ^= zobrist::en_passant_key(en_passant_);
    }
    en_passant_ = ep;
    if (en_passant_ != kNoSquare) {
        key_ ^= zobrist::en_passant_key(en_passant_);
    }
}

}  // namespace gambit::chess
