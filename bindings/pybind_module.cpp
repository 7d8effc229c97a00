/// @file pybind_module.cpp
/// pybind11 bindings for the gambit chess engine.
///
/// Exposes the `_gambit_engine` Python module with an `Engine` class.
/// Positions cross the boundary as FEN strings and moves as UCI strings.

#include <gambit/engine.hpp>

#include <cstdint>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>

namespace py = pybind11;

PYBIND11_MODULE(_gambit_engine, m) {
    m.doc() = "Minimax chess engine with alpha-beta pruning (pybind11)";

    // ── Engine class ────────────────────────────────────────────────────
    py::class_<gambit::Engine>(m, "Engine")
        .def(py::init<int>(), py::arg("depth") = gambit::Engine::kDefaultDepth,
             "Create an engine searching *depth* plies (clamped to 1..10).")

        .def(
            "choose_best_move",
            [](gambit::Engine& self, const std::string& fen, int depth, std::int64_t time_limit_ms,
               std::uint64_t node_limit) -> py::tuple {
                const auto pos = gambit::chess::Position::from_fen(fen);
                gambit::SearchConfig config = self.config();
                if (depth > 0) {
                    config.max_depth = depth;
                }
                config.time_limit_ms = time_limit_ms;
                config.node_limit = node_limit;
                config.on_depth = nullptr;

                gambit::chess::ChessResult result;
                {
                    // Release the GIL so another Python thread can call cancel().
                    py::gil_scoped_release release;
                    result = self.choose_best_move(pos, config);
                }

                const std::string uci = result.best_move ? result.best_move->uci() : "";
                return py::make_tuple(uci, result.score, result.depth,
                                      static_cast<std::int64_t>(result.nodes));
            },
            py::arg("fen"), py::arg("depth") = 0, py::arg("time_limit_ms") = -1,
            py::arg("node_limit") = 0,
            R"doc(Choose a move for the side to move in *fen*.

*depth* 0 uses the engine's depth setting. Returns
``(uci_move, score, depth, nodes)``; *uci_move* is empty when the game
is already over. Scores are from White's point of view.)doc")

        .def("set_depth", &gambit::Engine::set_depth, py::arg("depth"),
             "Set the search depth (clamped to 1..10).")

        .def_property_readonly("depth", &gambit::Engine::depth)

        .def("cancel", &gambit::Engine::cancel, "Cancel the running search, or the next one if none is running (thread-safe).")

        .def(
            "evaluate",
            [](const gambit::Engine& self, const std::string& fen) {
                return self.evaluate(gambit::chess::Position::from_fen(fen));
            },
            py::arg("fen"), "Static evaluation of *fen* from White's point of view.");
}
