/// @file gambit_cli.cpp
/// Console front end: human vs engine, engine vs engine, best move, perft, eval.

#include <gambit/chess/notation.hpp>
#include <gambit/engine.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

using gambit::Engine;
using gambit::SearchConfig;
using gambit::chess::Color;
using gambit::chess::Position;
namespace movegen = gambit::chess::movegen;
namespace notation = gambit::chess::notation;

namespace {

// ── Argument helpers ────────────────────────────────────────────────────────

void usage(std::string_view exe) {
    std::cerr << "Usage:\n"
              << "  " << exe << " play [--engine white|black] [--depth N] [--fen <fen>]\n"
              << "  " << exe << " selfplay [--white-depth N] [--black-depth N] [--max-plies N]"
              << " [--fen <fen>]\n"
              << "  " << exe << " bestmove [--depth N] [--fen <fen>]\n"
              << "  " << exe << " perft <depth> [--fen <fen>]\n"
              << "  " << exe << " eval [--fen <fen>]\n"
              << "Search options:\n"
              << "  --time-ms N  --nodes N  --tie-break first|random  --seed N\n"
              << "  --threads N  --tt  --quiet\n";
}

std::optional<std::string> arg_value(int argc, char** argv, std::string_view key) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view(argv[i]) == key)
            return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

bool has_flag(int argc, char** argv, std::string_view key) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == key)
            return true;
    }
    return false;
}

template <typename Int>
Int parse_number(std::string_view text, std::string_view what) {
    Int value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::invalid_argument(std::string(what) + " expects an integer, got '" +
                                    std::string(text) + "'");
    }
    return value;
}

template <typename Int>
Int int_arg(int argc, char** argv, std::string_view key, Int def) {
    if (auto v = arg_value(argc, argv, key))
        return parse_number<Int>(*v, key);
    return def;
}

Position load_position(int argc, char** argv) {
    if (auto fen = arg_value(argc, argv, "--fen"))
        return Position::from_fen(*fen);
    return Position::initial();
}

// ── Engine setup ────────────────────────────────────────────────────────────

void configure(Engine& engine, int argc, char** argv, int depth) {
    engine.set_depth(depth);
    if (engine.depth() != depth) {
        std::cerr << "warning: depth " << depth << " clamped to " << engine.depth() << "\n";
    }

    SearchConfig& config = engine.config();
    config.time_limit_ms = int_arg<std::int64_t>(argc, argv, "--time-ms", -1);
    config.node_limit = int_arg<std::uint64_t>(argc, argv, "--nodes", 0);
    config.seed = int_arg<std::uint64_t>(argc, argv, "--seed", 0);
    config.threads = int_arg<int>(argc, argv, "--threads", 1);
    config.use_tt = has_flag(argc, argv, "--tt");

    if (auto tb = arg_value(argc, argv, "--tie-break")) {
        if (*tb == "first") {
            config.tie_break = gambit::TieBreak::First;
        } else if (*tb == "random") {
            config.tie_break = gambit::TieBreak::Random;
        } else {
            std::cerr << "warning: unknown --tie-break '" << *tb << "', using first\n";
        }
    }

    if (!has_flag(argc, argv, "--quiet")) {
        config.on_depth = [](const gambit::SearchInfo& info) {
            std::cerr << "info depth " << info.depth << " score " << info.score << " nodes "
                      << info.nodes << " cutoffs " << info.cutoffs << " time "
                      << info.elapsed_ms << "\n";
        };
    }
}

std::string color_name(Color c) {
    return c == Color::White ? "White" : "Black";
}

/// Centipawns, or "White mates in N" for a forced result.
std::string score_text(gambit::Score s) {
    const int plies = gambit::plies_to_result(s);
    if (plies < 0)
        return std::to_string(s);
    return color_name(s > 0 ? Color::White : Color::Black) + " mates in " +
           std::to_string((plies + 1) / 2);
}

/// Search and play the engine's move. Returns false if no move was found.
bool engine_move(Engine& engine, Position& pos) {
    const auto r = engine.choose_best_move(pos);
    if (!r.best_move) {
        std::cout << "Engine found no move.\n";
        return false;
    }
    std::cout << color_name(pos.side_to_move()) << " plays " << notation::san(pos, *r.best_move)
              << " (score " << score_text(r.score) << ", depth " << r.depth << ", nodes " << r.nodes
              << ", cutoffs " << r.cutoffs << ", " << r.elapsed_ms << " ms)\n";
    pos.make_move(*r.best_move);
    return true;
}

void print_result(const Position& pos) {
    std::cout << "\nGame over!\n" << notation::render(pos);
    switch (movegen::status(pos)) {
        case movegen::GameStatus::Checkmate:
            std::cout << "Checkmate! " << color_name(gambit::chess::opposite(pos.side_to_move()))
                      << " wins!\n";
            break;
        case movegen::GameStatus::Stalemate:
            std::cout << "Stalemate! The game is a draw.\n";
            break;
        case movegen::GameStatus::InsufficientMaterial:
            std::cout << "Draw due to insufficient material.\n";
            break;
        case movegen::GameStatus::FiftyMoveRule:
            std::cout << "Draw by fifty-move rule.\n";
            break;
        case movegen::GameStatus::ThreefoldRepetition:
            std::cout << "Draw by threefold repetition.\n";
            break;
        case movegen::GameStatus::Ongoing:
            std::cout << "Game ended.\n";
            break;
    }
}

// ── Commands ────────────────────────────────────────────────────────────────

void cmd_play(int argc, char** argv) {
    const std::string engine_str = arg_value(argc, argv, "--engine").value_or("black");
    if (engine_str != "white" && engine_str != "black") {
        throw std::invalid_argument("--engine expects white or black, got '" + engine_str + "'");
    }
    const Color engine_side = engine_str == "white" ? Color::White : Color::Black;

    Engine engine;
    configure(engine, argc, argv, int_arg<int>(argc, argv, "--depth", Engine::kDefaultDepth));
    Position pos = load_position(argc, argv);

    std::cout << "You are playing as " << color_name(gambit::chess::opposite(engine_side))
              << "\nEnter moves in UCI (e2e4) or SAN (e4). 'board' redraws, 'quit' exits.\n";

    while (movegen::status(pos) == movegen::GameStatus::Ongoing) {
        std::cout << "\n" << notation::render(pos);
        if (pos.is_in_check())
            std::cout << "CHECK!\n";
        std::cout << color_name(pos.side_to_move()) << " to move\n";

        if (pos.side_to_move() == engine_side) {
            if (!engine_move(engine, pos))
                break;
            continue;
        }

        std::cout << "Your move: " << std::flush;
        std::string line;
        const bool eof = !std::getline(std::cin, line);
        const notation::Command command = notation::parse_command(line);
        if (eof || command == notation::Command::Quit) {
            std::cout << "Game terminated by user\n";
            return;
        }
        if (command == notation::Command::Board)
            continue;
        try {
            pos.make_move(notation::parse_move(pos, line));
        } catch (const std::invalid_argument& e) {
            std::cout << e.what() << "\nLegal moves:";
            for (const auto& m : movegen::legal(pos)) std::cout << ' ' << notation::san(pos, m);
            std::cout << "\n";
        }
    }
    print_result(pos);
}

void cmd_selfplay(int argc, char** argv) {
    const int depth = int_arg<int>(argc, argv, "--depth", Engine::kDefaultDepth);
    const int max_plies = int_arg<int>(argc, argv, "--max-plies", 200);

    Engine white;
    Engine black;
    configure(white, argc, argv, int_arg<int>(argc, argv, "--white-depth", depth));
    configure(black, argc, argv, int_arg<int>(argc, argv, "--black-depth", depth));
    Position pos = load_position(argc, argv);

    std::cout << "Engine vs engine: depth " << white.depth() << " (White) vs depth "
              << black.depth() << " (Black)\n";

    int ply = 0;
    for (; ply < max_plies && movegen::status(pos) == movegen::GameStatus::Ongoing; ++ply) {
        std::cout << ply + 1 << ". ";
        Engine& engine = pos.side_to_move() == Color::White ? white : black;
        if (!engine_move(engine, pos))
            break;
    }
    if (ply >= max_plies && movegen::status(pos) == movegen::GameStatus::Ongoing) {
        std::cout << "\nStopped after " << max_plies << " plies.\n";
        return;
    }
    print_result(pos);
}

void cmd_bestmove(int argc, char** argv) {
    Engine engine;
    configure(engine, argc, argv, int_arg<int>(argc, argv, "--depth", Engine::kDefaultDepth));
    Position pos = load_position(argc, argv);

    std::cout << notation::render(pos) << "FEN: " << pos.to_fen() << "\n\n";

    const auto r = engine.choose_best_move(pos);
    std::cout << "bestmove " << (r.best_move ? r.best_move->uci() : "(none)") << "\n"
              << "score    " << score_text(r.score) << "\n"
              << "depth    " << r.depth << "\n"
              << "ties     " << r.ties << "\n"
              << "nodes    " << r.nodes << "\n"
              << "cutoffs  " << r.cutoffs << "\n"
              << "time     " << r.elapsed_ms << " ms\n";
}

void cmd_perft(int argc, char** argv) {
    if (argc < 3)
        throw std::invalid_argument("perft: missing depth");
    const int depth = parse_number<int>(argv[2], "perft depth");
    Position pos = load_position(argc, argv);

    const auto start = std::chrono::steady_clock::now();
    const std::uint64_t nodes = movegen::perft(pos, depth);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count();

    std::cout << "Nodes: " << nodes << "\n"
              << "Time : " << ms << " ms\n";
}

void cmd_eval(int argc, char** argv) {
    const Position pos = load_position(argc, argv);
    const Engine engine;

    std::cout << notation::render(pos) << "FEN: " << pos.to_fen() << "\n"
              << "status     " << movegen::status_name(movegen::status(pos)) << "\n"
              << "material   " << gambit::chess::eval::material(pos) << "\n"
              << "positional " << gambit::chess::eval::positional(pos) << "\n"
              << "mobility   " << gambit::chess::eval::mobility(pos) << "\n"
              << "endgame    " << (gambit::chess::eval::is_endgame(pos) ? "yes" : "no") << "\n"
              << "score      " << engine.evaluate(pos) << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            usage(argv[0]);
            return 1;
        }
        const std::string_view cmd = argv[1];
        if (cmd == "play") {
            cmd_play(argc, argv);
        } else if (cmd == "selfplay") {
            cmd_selfplay(argc, argv);
        } else if (cmd == "bestmove") {
            cmd_bestmove(argc, argv);
        } else if (cmd == "perft") {
            cmd_perft(argc, argv);
        } else if (cmd == "eval") {
            cmd_eval(argc, argv);
        } else {
            usage(argv[0]);
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
