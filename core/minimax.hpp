#pragma once

#include "rules.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace kalah {

template <typename State>
using MoveOrderFn = std::vector<Move> (*)(const State&);

// Utility of a state for `player`; larger is better.
template <typename State>
using StateEvalFn = float (*)(const State&, Player);

template <typename State>
std::vector<Move> default_move_order(const State& s) {
    return valid_moves(s);
}

template <typename State>
float store_differential(const State& s, Player p) {
    return (float)(score(s, p) - score(s, opponent(p)));
}

// Default strategy: three plain function pointers that can be swapped one at a time.
// A custom strategy type only needs the three const member functions below.
template <typename State>
struct FunctionStrategy {
    MoveOrderFn<State> order_fn = &default_move_order<State>;
    StateEvalFn<State> evaluator_fn = &store_differential<State>;
    StateEvalFn<State> heuristic_fn = &store_differential<State>;

    std::vector<Move> order_moves(const State& s) const { return order_fn(s); }
    float evaluate(const State& s, Player p) const { return evaluator_fn(s, p); }
    float heuristic(const State& s, Player p) const { return heuristic_fn(s, p); }
};

struct SearchStats {
    uint64_t nodes = 0;
    uint64_t cutoffs = 0;
};

// Per-call search bookkeeping. Lives on the caller's stack, so one Minimax can
// serve several threads at once.
struct SearchContext {
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    SearchStats stats;
};

template <typename State, typename Strategy>
class MinimaxBuilder;

template <typename State, typename Strategy = FunctionStrategy<State>>
class Minimax {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::nanoseconds;

    Player optimize_for() const { return optimize_for_; }
    std::optional<int> max_depth() const { return max_depth_; }
    std::optional<Duration> max_time() const { return max_time_; }
    const Strategy& strategy() const { return strategy_; }

    std::vector<Move> order_moves(const State& s) const { return strategy_.order_moves(s); }
    float evaluate(const State& s) const { return strategy_.evaluate(s, optimize_for_); }
    float get_heuristic(const State& s) const { return strategy_.heuristic(s, optimize_for_); }

    std::optional<Move> search(const State& s) const {
        std::optional<MoveUtility> r = search_utility(s);
        if (!r) return std::nullopt;
        return r->move;
    }

    std::optional<MoveUtility> search_utility(const State& s) const {
        SearchContext ctx;
        return search_utility_with(s, ctx);
    }

    // Same as search_utility, also reporting node/cutoff counts.
    std::optional<MoveUtility> search_utility_with_stats(const State& s, SearchStats& stats) const {
        SearchContext ctx;
        std::optional<MoveUtility> r = search_utility_with(s, ctx);
        stats = ctx.stats;
        return r;
    }

    // Every root move solved with a full window; no pruning between root children.
    std::optional<std::vector<MoveUtility>> search_utility_all(const State& s) const {
        SearchContext ctx;
        if (is_over(s) || depth_reached(0) || time_exceeded(ctx)) return std::nullopt;

        std::vector<MoveUtility> out;
        for (const Move& m : order_moves(s)) {
            std::optional<State> next = make_move(s, m);
            if (!next) continue;
            NodeValue child = descend(s, *next, kNegInf, kPosInf, 1, true, ctx);
            out.push_back(MoveUtility{m, child.value});
        }
        if (out.empty()) return std::nullopt;
        return out;
    }

private:
    friend class MinimaxBuilder<State, Strategy>;

    static constexpr float kNegInf = -std::numeric_limits<float>::infinity();
    static constexpr float kPosInf = std::numeric_limits<float>::infinity();

    struct NodeValue {
        std::optional<Move> best;
        float value;
    };

    Minimax(Player optimize_for, std::optional<int> max_depth, std::optional<Duration> max_time,
            Strategy strategy)
        : optimize_for_(optimize_for), max_depth_(max_depth), max_time_(max_time),
          strategy_(std::move(strategy)) {}

    std::optional<MoveUtility> search_utility_with(const State& s, SearchContext& ctx) const {
        ctx.start = Clock::now();
        NodeValue root = max_value(s, kNegInf, kPosInf, 0, ctx);
        if (!root.best) return std::nullopt;
        return MoveUtility{*root.best, root.value};
    }

    bool depth_reached(int depth) const { return max_depth_ && depth >= *max_depth_; }

    bool time_exceeded(const SearchContext& ctx) const {
        return max_time_ && Clock::now() - ctx.start >= *max_time_;
    }

    // A bonus turn keeps the same role; otherwise the role flips.
    NodeValue descend(const State& parent, const State& child, float alpha, float beta,
                      int depth, bool parent_maximizing, SearchContext& ctx) const {
        bool same_mover = child.current_turn() == parent.current_turn();
        bool maximizing = same_mover ? parent_maximizing : !parent_maximizing;
        return maximizing ? max_value(child, alpha, beta, depth, ctx)
                          : min_value(child, alpha, beta, depth, ctx);
    }

    NodeValue max_value(const State& s, float alpha, float beta, int depth, SearchContext& ctx) const {
        ctx.stats.nodes++;
        if (is_over(s)) return NodeValue{std::nullopt, evaluate(s)};
        if (depth_reached(depth) || time_exceeded(ctx)) return NodeValue{std::nullopt, get_heuristic(s)};

        NodeValue best{std::nullopt, kNegInf};
        for (const Move& m : order_moves(s)) {
            std::optional<State> next = make_move(s, m);
            if (!next) continue;
            float v = descend(s, *next, alpha, beta, depth + 1, true, ctx).value;
            // Strictly greater: the first move reaching the best value wins ties.
            if (!best.best || v > best.value) {
                best.value = v;
                best.best = m;
                if (v > alpha) alpha = v;
            }
            if (best.value >= beta) {
                ctx.stats.cutoffs++;
                return best;
            }
        }
        return best;
    }

    NodeValue min_value(const State& s, float alpha, float beta, int depth, SearchContext& ctx) const {
        ctx.stats.nodes++;
        if (is_over(s)) return NodeValue{std::nullopt, evaluate(s)};
        if (depth_reached(depth) || time_exceeded(ctx)) return NodeValue{std::nullopt, get_heuristic(s)};

        NodeValue best{std::nullopt, kPosInf};
        for (const Move& m : order_moves(s)) {
            std::optional<State> next = make_move(s, m);
            if (!next) continue;
            float v = descend(s, *next, alpha, beta, depth + 1, false, ctx).value;
            if (!best.best || v < best.value) {
                best.value = v;
                best.best = m;
                if (v < beta) beta = v;
            }
            if (best.value <= alpha) {
                ctx.stats.cutoffs++;
                return best;
            }
        }
        return best;
    }

    Player optimize_for_;
    std::optional<int> max_depth_;
    std::optional<Duration> max_time_;
    Strategy strategy_;
};

} // namespace kalah
