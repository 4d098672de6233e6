#pragma once

#include "minimax.hpp"

#include <type_traits>
#include <utility>

namespace kalah {

// Accumulates overrides on top of the defaults:
//   optimize_for = Player::One, max_depth = 12, max_time = none,
//   move order = descending pit then swap, evaluator = heuristic = store differential.
// Nothing is validated; a strategy that skips legal moves or is
// non-deterministic is the caller's problem.
template <typename State, typename Strategy = FunctionStrategy<State>>
class MinimaxBuilder {
public:
    using Duration = typename Minimax<State, Strategy>::Duration;

    MinimaxBuilder() = default;
    explicit MinimaxBuilder(Strategy strategy) : strategy_(std::move(strategy)) {}

    MinimaxBuilder& optimize_for(Player p) {
        optimize_for_ = p;
        return *this;
    }

    // std::nullopt removes the limit. With no time limit either, the search
    // only stops once the whole tree is explored.
    MinimaxBuilder& max_depth(std::optional<int> depth) {
        max_depth_ = depth;
        return *this;
    }

    MinimaxBuilder& max_time(std::optional<Duration> time) {
        max_time_ = time;
        return *this;
    }

    MinimaxBuilder& move_orderer(MoveOrderFn<State> fn) {
        static_assert(std::is_same<Strategy, FunctionStrategy<State>>::value,
                      "move_orderer() needs the function-pointer strategy");
        strategy_.order_fn = fn;
        return *this;
    }

    // Used on terminal states only.
    MinimaxBuilder& evaluator(StateEvalFn<State> fn) {
        static_assert(std::is_same<Strategy, FunctionStrategy<State>>::value,
                      "evaluator() needs the function-pointer strategy");
        strategy_.evaluator_fn = fn;
        return *this;
    }

    // Used when the depth or time limit cuts the search off.
    MinimaxBuilder& heuristic(StateEvalFn<State> fn) {
        static_assert(std::is_same<Strategy, FunctionStrategy<State>>::value,
                      "heuristic() needs the function-pointer strategy");
        strategy_.heuristic_fn = fn;
        return *this;
    }

    template <typename Other>
    MinimaxBuilder<State, Other> with_strategy(Other strategy) const {
        MinimaxBuilder<State, Other> out(std::move(strategy));
        out.optimize_for(optimize_for_).max_depth(max_depth_).max_time(max_time_);
        return out;
    }

    Player optimize_for() const { return optimize_for_; }
    std::optional<int> max_depth() const { return max_depth_; }
    std::optional<Duration> max_time() const { return max_time_; }

    Minimax<State, Strategy> build() const {
        return Minimax<State, Strategy>(optimize_for_, max_depth_, max_time_, strategy_);
    }

private:
    Player optimize_for_ = Player::One;
    std::optional<int> max_depth_ = 12;
    std::optional<Duration> max_time_;
    Strategy strategy_;
};

} // namespace kalah
