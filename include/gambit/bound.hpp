#pragma once

/// @file bound.hpp
/// Monotonic score bound shared by parallel root-search workers.

#include <gambit/score.hpp>

#include <atomic>

namespace gambit {

/// A score that can only move in one direction once constructed.
///
/// A Maximizer root uses `raise` (best score so far only grows); a Minimizer
/// root uses `lower`. Updates are compare-and-swap loops, so concurrent
/// workers can never loosen a bound another worker has tightened.
class SharedBound {
   public:
    explicit SharedBound(Score initial) noexcept : value_(initial) {}

    SharedBound(const SharedBound&) = delete;
    SharedBound& operator=(const SharedBound&) = delete;

    [[nodiscard]] Score load() const noexcept { return value_.load(std::memory_order_acquire); }

    /// Raise the bound to `s` if `s` is higher. Returns true if it changed.
    bool raise(Score s) noexcept {
        Score cur = value_.load(std::memory_order_relaxed);
        while (s > cur) {
            if (value_.compare_exchange_weak(cur, s, std::memory_order_acq_rel,
                                             std::memory_order_relaxed))
                return true;
        }
        return false;
    }

    /// Lower the bound to `s` if `s` is lower. Returns true if it changed.
    bool lower(Score s) noexcept {
        Score cur = value_.load(std::memory_order_relaxed);
        while (s < cur) {
            if (value_.compare_exchange_weak(cur, s, std::memory_order_acq_rel,
                                             std::memory_order_relaxed))
                return true;
        }
        return false;
    }

    /// Tighten in the direction that favours `side`.
    bool tighten(Side side, Score s) noexcept {
        return side == Side::Maximizer ? raise(s) : lower(s);
    }

   private:
    std::atomic<Score> value_;
};

}  // namespace gambit
