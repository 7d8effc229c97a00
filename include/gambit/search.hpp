#pragma once

/// @file search.hpp
/// Minimax search with alpha-beta pruning and the move-selection driver.
///
/// The search branches explicitly on the side to move: Maximizer nodes raise
/// alpha, Minimizer nodes lower beta, and a node stops once the window
/// closes. The driver runs it by iterative deepening, applies the root
/// tie-break policy and can split root moves across threads.
///
/// Game and evaluator requirements are documented in game.hpp.

#include <gambit/bound.hpp>
#include <gambit/game.hpp>
#include <gambit/score.hpp>
#include <gambit/tt.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <numeric>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace gambit {

// ── Constants ───────────────────────────────────────────────────────────────

inline constexpr int kMaxSearchDepth = 64;

// ── Configuration ───────────────────────────────────────────────────────────

/// How to choose among root moves with the same best score.
enum class TieBreak : std::uint8_t {
    First = 0,   ///< Earliest in move generation order.
    Random = 1,  ///< Uniform among ties, seeded by SearchConfig::seed.
};

/// Progress report emitted after each completed depth.
struct SearchInfo {
    int depth = 0;
    Score score = 0;
    std::uint64_t nodes = 0;
    std::uint64_t cutoffs = 0;
    std::int64_t elapsed_ms = 0;
};

using SearchInfoCallback = std::function<void(const SearchInfo&)>;

struct SearchConfig {
    int max_depth = 3;                ///< Plies; 0 evaluates the root only.
    std::int64_t time_limit_ms = -1;  ///< -1 = no time limit. Checked between depths.
    std::uint64_t node_limit = 0;     ///< 0 = unlimited. Checked between depths.
    TieBreak tie_break = TieBreak::First;
    std::uint64_t seed = 0;  ///< Seed for TieBreak::Random.
    bool iterative = true;   ///< Iterative deepening; false searches max_depth only.
    bool alpha_beta = true;  ///< false = plain minimax (same result, more nodes).
    bool move_ordering = true;
    bool use_tt = false;
    std::size_t tt_mb = TranspositionTable::kDefaultSizeMB;
    int threads = 1;  ///< Root-split workers.
    SearchInfoCallback on_depth{};
};

// ── Search result ───────────────────────────────────────────────────────────

template <typename Move>
struct SearchResult {
    std::optional<Move> best_move{};  ///< Empty on a terminal root or at depth 0.
    Score score = 0;                  ///< Maximizer's point of view.
    int depth = 0;                    ///< Last completed depth.
    int ties = 0;                     ///< Root moves sharing the best score.
    std::uint64_t nodes = 0;
    std::uint64_t evaluations = 0;  ///< Heuristic evaluations (depth-limited leaves).
    std::uint64_t cutoffs = 0;      ///< Branches pruned by alpha-beta.
    std::uint64_t tt_hits = 0;
    std::int64_t elapsed_ms = 0;
};

struct SearchStats {
    std::uint64_t nodes = 0;
    std::uint64_t evaluations = 0;
    std::uint64_t cutoffs = 0;
    std::uint64_t tt_hits = 0;

    SearchStats& operator+=(const SearchStats& o) noexcept {
        nodes += o.nodes;
        evaluations += o.evaluations;
        cutoffs += o.cutoffs;
        tt_hits += o.tt_hits;
        return *this;
    }
};

/// Throws std::invalid_argument if `config` cannot be searched.
inline void validate(const SearchConfig& config) {
    if (config.max_depth < 0 || config.max_depth > kMaxSearchDepth) {
        throw std::invalid_argument("max_depth must be in [0, " +
                                    std::to_string(kMaxSearchDepth) +
                                    "], got " + std::to_string(config.max_depth));
    }
    if (config.threads < 1) {
        throw std::invalid_argument("threads must be >= 1, got " +
                                    std::to_string(config.threads));
    }
}

namespace detail {

// ── Search worker ───────────────────────────────────────────────────────────

/// One recursive searcher. Owns its killers, ordering scratch and table;
/// shares nothing mutable with sibling workers.
template <typename Game, typename Evaluator>
class SearchWorker {
   public:
    using Position = typename Game::Position;
    using Move = typename Game::Move;
    using MoveList = decltype(std::declval<const Game&>().legal_moves(std::declval<Position&>()));

    SearchWorker(const Game& game, const Evaluator& evaluate, const SearchConfig& config,
                 const std::atomic<bool>& cancelled, std::size_t tt_mb)
        : game_(game), evaluate_(evaluate), config_(config), cancelled_(cancelled) {
        if (config_.use_tt) {
            tt_ = std::make_unique<TranspositionTable>(tt_mb);
        }
    }

    /// Reset per-iteration state. Table entries survive between iterations.
    void begin_iteration() {
        for (auto& k : killers_) {
            k[0].reset();
            k[1].reset();
        }
        if (tt_)
            tt_->new_search();
    }

    Score search(Position& pos, int depth, Score alpha, Score beta, Side side, int ply);

    /// Heuristic score of `pos`, clamped below the win/loss range.
    Score evaluate(const Position& pos) {
        ++stats_.evaluations;
        return clamp_heuristic(evaluate_(pos));
    }

    [[nodiscard]] bool aborted() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const SearchStats& stats() const noexcept { return stats_; }
    SearchStats& stats() noexcept { return stats_; }

   private:
    const std::vector<std::uint16_t>& order_moves(Position& pos, const MoveList& moves,
                                                  std::uint16_t tt_index, int ply);
    void record_killer(const Move& m, int ply);

    const Game& game_;
    const Evaluator& evaluate_;
    const SearchConfig& config_;
    const std::atomic<bool>& cancelled_;
    std::unique_ptr<TranspositionTable> tt_;

    // Killer moves: 2 per ply
    std::array<std::array<std::optional<Move>, 2>, kMaxPly> killers_{};

    // Per-ply ordering scratch, reused across nodes
    std::array<std::vector<std::uint16_t>, kMaxSearchDepth + 1> order_{};
    std::array<std::vector<long long>, kMaxSearchDepth + 1> keys_{};

    SearchStats stats_{};
};

// ── Minimax with alpha-beta ─────────────────────────────────────────────────

template <typename Game, typename Evaluator>
Score SearchWorker<Game, Evaluator>::search(Position& pos, int depth, Score alpha, Score beta,
                                            Side side, int ply) {
    ++stats_.nodes;

    // Exact results are never second-guessed by the heuristic.
    const Outcome outcome = game_.outcome(pos);
    if (outcome != Outcome::Ongoing)
        return terminal_score(outcome, ply);

    if (depth <= 0 || aborted())
        return evaluate(pos);

    // ── Transposition table probe ───────────────────────────────────────
    const Score alpha_orig = alpha;
    const Score beta_orig = beta;
    std::uint16_t tt_index = kNoMoveIndex;
    std::uint64_t key = 0;

    if (tt_) {
        key = game_.key(pos);
        TTEntry entry{};
        if (tt_->probe(key, entry)) {
            tt_index = entry.move_index;
            // Only an entry searched to exactly this depth has the same value.
            if (entry.depth == depth) {
                ++stats_.tt_hits;
                const Score tt_score = score_from_tt(entry.score, ply);
                if (entry.bound == Bound::Exact)
                    return tt_score;
                if (config_.alpha_beta) {
                    if (entry.bound == Bound::Lower)
                        alpha = std::max(alpha, tt_score);
                    if (entry.bound == Bound::Upper)
                        beta = std::min(beta, tt_score);
                    if (alpha >= beta)
                        return tt_score;
                }
            }
        }
    }

    // ── Generate legal moves ────────────────────────────────────────────
    MoveList moves = game_.legal_moves(pos);
    const int n = static_cast<int>(moves.size());

    // Rules said "ongoing" but nothing is playable: score it as a draw.
    if (n == 0)
        return kDrawScore;

    const std::vector<std::uint16_t>& order = order_moves(pos, moves, tt_index, ply);

    const bool maximizing = (side == Side::Maximizer);
    Score best = maximizing ? -kInfScore : kInfScore;
    std::uint16_t best_index = kNoMoveIndex;

    for (int k = 0; k < n; ++k) {
        const std::uint16_t i = order[k];
        const Move& m = moves[i];

        game_.play(pos, m);
        const Score score = search(pos, depth - 1, alpha, beta, game_.side_to_move(pos), ply + 1);
        game_.undo(pos, m);

        if (maximizing) {
            if (score > best) {
                best = score;
                best_index = i;
            }
            alpha = std::max(alpha, best);
        } else {
            if (score < best) {
                best = score;
                best_index = i;
            }
            beta = std::min(beta, best);
        }

        if (config_.alpha_beta && alpha >= beta) {
            // The ancestor on the other side will never allow this line.
            ++stats_.cutoffs;
            record_killer(m, ply);
            break;
        }
        if (aborted())
            break;
    }

    // ── Store in TT ─────────────────────────────────────────────────────
    if (tt_ && !aborted()) {
        Bound bound = Bound::Exact;
        if (config_.alpha_beta) {
            if (best <= alpha_orig) {
                bound = Bound::Upper;
            } else if (best >= beta_orig) {
                bound = Bound::Lower;
            }
        }
        tt_->store(key, depth, score_to_tt(best, ply), bound, best_index);
    }

    return best;
}

// ── Move ordering ───────────────────────────────────────────────────────────

/// Indices into `moves`, best first: table move, killers, then the game's
/// priority hint. Stable, so equal keys keep generation order.
template <typename Game, typename Evaluator>
const std::vector<std::uint16_t>& SearchWorker<Game, Evaluator>::order_moves(
    Position& pos, const MoveList& moves, std::uint16_t tt_index, int ply) {
    const auto n = static_cast<std::size_t>(moves.size());
    auto& order = order_[static_cast<std::size_t>(ply)];
    auto& keys = keys_[static_cast<std::size_t>(ply)];

    order.resize(n);
    std::iota(order.begin(), order.end(), std::uint16_t{0});
    if (!config_.move_ordering)
        return order;

    constexpr long long kTier = 1LL << 32;
    keys.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        const Move& m = moves[i];
        long long key = game_.move_priority(pos, m);
        if (i == static_cast<std::size_t>(tt_index)) {
            key += 3 * kTier;
        } else if (ply < kMaxPly && killers_[ply][0] && *killers_[ply][0] == m) {
            key += 2 * kTier;
        } else if (ply < kMaxPly && killers_[ply][1] && *killers_[ply][1] == m) {
            key += kTier;
        }
        keys[i] = key;
    }

    std::stable_sort(order.begin(), order.end(),
                     [&keys](std::uint16_t a, std::uint16_t b) { return keys[a] > keys[b]; });
    return order;
}

// ── Killer moves ────────────────────────────────────────────────────────────

template <typename Game, typename Evaluator>
void SearchWorker<Game, Evaluator>::record_killer(const Move& m, int ply) {
    if (ply < 0 || ply >= kMaxPly)
        return;
    auto& slots = killers_[ply];
    if (slots[0] && *slots[0] == m)
        return;
    slots[1] = std::move(slots[0]);
    slots[0] = m;
}

/// Clears a cancel request when the search that owns it returns.
class CancelReset {
   public:
    explicit CancelReset(std::atomic<bool>& flag) noexcept : flag_(flag) {}
    ~CancelReset() { flag_.store(false, std::memory_order_relaxed); }

    CancelReset(const CancelReset&) = delete;
    CancelReset& operator=(const CancelReset&) = delete;

   private:
    std::atomic<bool>& flag_;
};

}  // namespace detail

// ── Searcher ────────────────────────────────────────────────────────────────

/// Chooses moves for any game satisfying the contract in game.hpp.
///
/// Each call to choose_best_move is independent: killers, tables and
/// counters start fresh, so identical inputs produce identical results.
template <typename Game, typename Evaluator>
class Searcher {
   public:
    using Position = typename Game::Position;
    using Move = typename Game::Move;
    using Result = SearchResult<Move>;

    explicit Searcher(Game game = Game{}, Evaluator evaluator = Evaluator{})
        : game_(std::move(game)), evaluator_(std::move(evaluator)) {}

    /// Pick the best move for the side to move in `root`.
    /// Throws std::invalid_argument on an invalid configuration.
    Result choose_best_move(const Position& root, const SearchConfig& config);

    /// One fixed-depth search of `pos` with an explicit window, no driver.
    /// Returns the minimax value of `pos` if it lies inside (alpha, beta).
    Score search(Position& pos, int depth, Score alpha, Score beta,
                 const SearchConfig& config = {});

    /// Stop the running search from another thread; the last completed depth
    /// is kept. A cancel issued while no search runs stops the next one at
    /// its first check. Each search clears the request when it returns.
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] const Game& game() const noexcept { return game_; }
    [[nodiscard]] const Evaluator& evaluator() const noexcept { return evaluator_; }

   private:
    using Worker = detail::SearchWorker<Game, Evaluator>;
    using MoveList = typename Worker::MoveList;

    struct Iteration {
        bool completed = false;
        Score best = 0;
        std::vector<int> ties;  ///< Generation indices, ascending.
    };

    Iteration search_root(const Position& root, const MoveList& moves,
                          const std::vector<int>& root_order, int depth, Side side,
                          std::vector<std::unique_ptr<Worker>>& workers);

    [[nodiscard]] bool budget_exhausted(const SearchConfig& config, std::int64_t elapsed_ms,
                                        std::uint64_t nodes) const noexcept;

    Game game_;
    Evaluator evaluator_;
    SearchConfig config_{};
    std::atomic<bool> cancelled_{false};
};

// ── Driver ──────────────────────────────────────────────────────────────────

template <typename Game, typename Evaluator>
typename Searcher<Game, Evaluator>::Result Searcher<Game, Evaluator>::choose_best_move(
    const Position& root, const SearchConfig& config) {
    validate(config);
    config_ = config;
    const detail::CancelReset reset(cancelled_);

    const auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now() - start)
            .count();
    };

    Position pos = root;
    Result result;
    result.nodes = 1;

    const Outcome outcome = game_.outcome(pos);
    if (outcome != Outcome::Ongoing) {
        result.score = terminal_score(outcome, 0);
        result.elapsed_ms = elapsed_ms();
        return result;
    }

    const Side side = game_.side_to_move(pos);
    MoveList moves = game_.legal_moves(pos);
    const int n = static_cast<int>(moves.size());

    if (config_.max_depth == 0 || n == 0) {
        // Depth 0 evaluates the root directly. No moves on an ongoing root is
        // a rules defect; it is scored as a draw like any other such node.
        if (n == 0) {
            result.score = kDrawScore;
        } else {
            result.score = clamp_heuristic(evaluator_(pos));
            result.evaluations = 1;
        }
        result.elapsed_ms = elapsed_ms();
        return result;
    }

    // Root order: generation order refined by the game's priority hint.
    std::vector<int> root_order(static_cast<std::size_t>(n));
    std::iota(root_order.begin(), root_order.end(), 0);
    if (config_.move_ordering) {
        std::vector<long long> keys(static_cast<std::size_t>(n));
        for (int i = 0; i < n; ++i) {
            keys[i] = game_.move_priority(pos, moves[i]);
        }
        std::stable_sort(root_order.begin(), root_order.end(),
                         [&keys](int a, int b) { return keys[a] > keys[b]; });
    }

    const int num_workers = std::min(config_.threads, n);
    const std::size_t tt_mb =
        std::max<std::size_t>(1, config_.tt_mb / static_cast<std::size_t>(num_workers));
    std::vector<std::unique_ptr<Worker>> workers;
    workers.reserve(static_cast<std::size_t>(num_workers));
    for (int w = 0; w < num_workers; ++w) {
        workers.push_back(
            std::make_unique<Worker>(game_, evaluator_, config_, cancelled_, tt_mb));
    }

    auto total_stats = [&workers]() {
        SearchStats s{};
        for (const auto& w : workers) s += w->stats();
        return s;
    };

    std::vector<int> final_ties;
    const int first_depth = config_.iterative ? 1 : config_.max_depth;

    // ── Iterative deepening ─────────────────────────────────────────────
    for (int depth = first_depth; depth <= config_.max_depth; ++depth) {
        Iteration it = search_root(pos, moves, root_order, depth, side, workers);
        if (!it.completed)
            break;

        const int chosen = it.ties.front();
        result.best_move = moves[chosen];
        result.score = it.best;
        result.depth = depth;
        result.ties = static_cast<int>(it.ties.size());
        final_ties = std::move(it.ties);

        // Best move first for the next iteration
        auto pos_it = std::find(root_order.begin(), root_order.end(), chosen);
        std::rotate(root_order.begin(), pos_it, pos_it + 1);

        const SearchStats stats = total_stats();
        if (config_.on_depth) {
            config_.on_depth(SearchInfo{depth, result.score, stats.nodes + 1, stats.cutoffs,
                                        elapsed_ms()});
        }

        // Budgets are checked only between depths so every reported
        // result comes from a completed depth.
        if (budget_exhausted(config_, elapsed_ms(), stats.nodes + 1))
            break;
    }

    if (!result.best_move) {
        // Cancelled before depth 1 completed.
        result.best_move = moves[root_order.front()];
        result.score = clamp_heuristic(evaluator_(pos));
        result.evaluations = 1;
        result.ties = 1;
    } else if (config_.tie_break == TieBreak::Random && final_ties.size() > 1) {
        std::mt19937_64 rng(config_.seed);
        std::uniform_int_distribution<std::size_t> pick(0, final_ties.size() - 1);
        result.best_move = moves[final_ties[pick(rng)]];
    }

    const SearchStats stats = total_stats();
    result.nodes += stats.nodes;
    result.evaluations += stats.evaluations;
    result.cutoffs = stats.cutoffs;
    result.tt_hits = stats.tt_hits;
    result.elapsed_ms = elapsed_ms();
    return result;
}

// ── Root search ─────────────────────────────────────────────────────────────

/// Search every root move to `depth`. After the first move, each move is
/// searched with a window one point wider than the best so far: a move that
/// ties the best is then known exactly, and a worse one fails low.
template <typename Game, typename Evaluator>
typename Searcher<Game, Evaluator>::Iteration Searcher<Game, Evaluator>::search_root(
    const Position& root, const MoveList& moves, const std::vector<int>& root_order, int depth,
    Side side, std::vector<std::unique_ptr<Worker>>& workers) {
    const int n = static_cast<int>(root_order.size());
    const bool maximizing = (side == Side::Maximizer);

    std::vector<Score> scores(static_cast<std::size_t>(n), 0);
    SharedBound bound(maximizing ? -kInfScore : kInfScore);
    std::atomic<int> next{0};

    auto run = [&](Worker& worker) {
        worker.begin_iteration();
        Position pos = root;
        for (;;) {
            const int k = next.fetch_add(1, std::memory_order_relaxed);
            if (k >= n || worker.aborted())
                break;
            const int i = root_order[k];

            // Re-read the shared bound before every move.
            Score alpha = -kInfScore;
            Score beta = kInfScore;
            if (config_.alpha_beta) {
                const Score b = bound.load();
                if (maximizing && b > -kInfScore) {
                    alpha = b - 1;
                } else if (!maximizing && b < kInfScore) {
                    beta = b + 1;
                }
            }

            const Move& m = moves[i];
            game_.play(pos, m);
            const Score s =
                worker.search(pos, depth - 1, alpha, beta, game_.side_to_move(pos), 1);
            game_.undo(pos, m);

            if (worker.aborted())
                break;
            scores[static_cast<std::size_t>(i)] = s;
            bound.tighten(side, s);
        }
    };

    if (workers.size() == 1) {
        run(*workers.front());
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers.size() - 1);
        for (std::size_t w = 1; w < workers.size(); ++w) {
            threads.emplace_back(run, std::ref(*workers[w]));
        }
        run(*workers.front());
        for (auto& t : threads) t.join();
    }

    Iteration it;
    if (cancelled_.load(std::memory_order_relaxed))
        return it;

    // The bound ends at the exact best score; fail-low moves never reach it.
    it.completed = true;
    it.best = bound.load();
    for (int i = 0; i < n; ++i) {
        if (scores[static_cast<std::size_t>(i)] == it.best)
            it.ties.push_back(i);
    }
    return it;
}

// ── Single search ───────────────────────────────────────────────────────────

template <typename Game, typename Evaluator>
Score Searcher<Game, Evaluator>::search(Position& pos, int depth, Score alpha, Score beta,
                                        const SearchConfig& config) {
    validate(config);
    if (depth < 0 || depth > kMaxSearchDepth) {
        throw std::invalid_argument("depth must be in [0, " + std::to_string(kMaxSearchDepth) +
                                    "], got " + std::to_string(depth));
    }
    config_ = config;
    const detail::CancelReset reset(cancelled_);
    Worker worker(game_, evaluator_, config_, cancelled_, config_.tt_mb);
    worker.begin_iteration();
    return worker.search(pos, depth, alpha, beta, game_.side_to_move(pos), 0);
}

// ── Budget check ────────────────────────────────────────────────────────────

template <typename Game, typename Evaluator>
bool Searcher<Game, Evaluator>::budget_exhausted(const SearchConfig& config,
                                                 std::int64_t elapsed_ms,
                                                 std::uint64_t nodes) const noexcept {
    if (config.time_limit_ms >= 0 && elapsed_ms >= config.time_limit_ms)
        return true;
    if (config.node_limit > 0 && nodes >= config.node_limit)
        return true;
    return false;
}

}  // namespace gambit
