#pragma once

/// @file notation.hpp
/// Move text in UCI and SAN, and a plain-text board diagram.

#include <gambit/chess/position.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace gambit::chess::notation {

/// UCI long-algebraic text, e.g. "e2e4", "e7e8q".
[[nodiscard]] inline std::string uci(const Move& m) {
    return m.uci();
}

/// Standard algebraic notation for a legal move in `pos`, e.g. "Nbd7",
/// "exd5", "e8=Q+", "O-O", "Qh4#".
[[nodiscard]] std::string san(const Position& pos, const Move& m);

/// Parse UCI first, then SAN (check and annotation suffixes optional).
/// Throws std::invalid_argument if the text names no legal move or is ambiguous.
[[nodiscard]] Move parse_move(const Position& pos, std::string_view text);

/// Words a player may type instead of a move.
enum class Command : std::uint8_t { None, Quit, Board };

/// Case-insensitive match of "quit"/"q" and "board", ignoring
/// surrounding whitespace. Anything else is Command::None.
[[nodiscard]] Command parse_command(std::string_view text);

/// Board diagram with rank and file labels, White at the bottom.
[[nodiscard]] std::string render(const Position& pos);

}  // namespace gambit::chess::notation
