#pragma once

#include "mancala.hpp"

#include <numeric>
#include <optional>
#include <random>
#include <utility>
#include <vector>

// Kalah rules over either board shape. Every transition returns a fresh state;
// the input is never touched, so a rejected move leaves the caller's state as it was.

namespace kalah {

template <typename State>
bool is_over(const State& s) {
    for (const auto& row : s.board()) {
        for (int pit : row) if (pit != 0) return false;
    }
    return true;
}

template <typename State>
int score(const State& s, Player p) {
    return s.stores()[index(p)];
}

template <typename State>
Outcome outcome(const State& s) {
    if (!is_over(s)) return Outcome::ongoing();
    int one = score(s, Player::One);
    int two = score(s, Player::Two);
    if (one > two) return Outcome::won_by(Player::One);
    if (two > one) return Outcome::won_by(Player::Two);
    return Outcome::tie();
}

// Only the reply to the opening move may swap. This is narrower than the
// traditional pie rule and is kept that way on purpose.
template <typename State>
bool swap_allowed(const State& s) {
    return s.current_turn() == Player::Two && s.ply() == 2;
}

// Descending pit number, Swap last. Search tie-breaking depends on this order.
template <typename State>
std::vector<Move> valid_moves(const State& s) {
    std::vector<Move> moves;
    if (is_over(s)) return moves;

    const auto& row = s.board()[index(s.current_turn())];
    moves.reserve(row.size() + 1);
    for (int pit = (int)row.size(); pit >= 1; pit--) {
        if (row[pit - 1] > 0) moves.push_back(pit_move(pit));
    }
    if (swap_allowed(s)) moves.push_back(swap_move());
    return moves;
}

// What a single transition did; filled in by make_move when requested.
struct MoveReport {
    bool go_again = false;
    int captured = 0;   // stones moved to the store by a capture, 0 if none
    bool swept = false; // the move ended the game
};

namespace detail {

template <typename Row>
int row_sum(const Row& row) {
    return std::accumulate(row.begin(), row.end(), 0);
}

template <typename State>
State apply_swap(const State& s) {
    State next = s;
    std::swap(next.board_mut()[0], next.board_mut()[1]);
    std::swap(next.stores_mut()[0], next.stores_mut()[1]);
    next.current_turn_mut() = opponent(s.current_turn());
    next.ply_mut() += 1;
    return next;
}

// Caller guarantees `pit` is in range and non-empty.
template <typename State>
State apply_sow(const State& s, int pit, MoveReport* report) {
    State next = s;
    auto& board = next.board_mut();
    auto& stores = next.stores_mut();

    const Player mover = s.current_turn();
    const int me = index(mover);
    const int n = (int)s.pits();

    int stones = board[me][pit - 1];
    board[me][pit - 1] = 0;

    // Lap: own pits, own store, opponent pits. The opponent store is skipped.
    int side = me;
    int pos = pit;  // position `n` on a row stands for the store after it
    bool go_again = false;
    while (stones > 0) {
        if (pos == n) {
            if (side == me) {
                stores[me]++;
                stones--;
                if (stones == 0) go_again = true;
            }
            side = 1 - side;
            pos = 0;
            continue;
        }

        board[side][pos]++;
        stones--;

        if (stones == 0 && side == me && board[side][pos] == 1) {
            const int opposite = n - 1 - pos;
            const int taken = board[me][pos] + board[1 - me][opposite];
            stores[me] += taken;
            if (report) report->captured = taken;
            board[me][pos] = 0;
            board[1 - me][opposite] = 0;
        }
        pos++;
    }

    // An empty row ends the game: the other side sweeps its own stones.
    int sweeper = -1;
    if (row_sum(board[0]) == 0) sweeper = 1;
    else if (row_sum(board[1]) == 0) sweeper = 0;
    if (sweeper >= 0) {
        if (report) report->swept = true;
        for (auto& stones_in_pit : board[sweeper]) {
            stores[sweeper] += stones_in_pit;
            stones_in_pit = 0;
        }
    }

    if (report) report->go_again = go_again;
    if (mover == Player::Two) next.set_player2_moved(true);
    if (!go_again) next.current_turn_mut() = opponent(mover);
    next.ply_mut() += 1;
    return next;
}

} // namespace detail

template <typename State>
std::optional<State> make_move(const State& s, const Move& m, MoveReport* report = nullptr) {
    if (report) *report = MoveReport{};
    if (m.swap) {
        if (!swap_allowed(s)) return std::nullopt;
        return detail::apply_swap(s);
    }
    if (m.pit < 1 || m.pit > (int)s.pits()) return std::nullopt;
    if (s.board()[index(s.current_turn())][m.pit - 1] == 0) return std::nullopt;
    return detail::apply_sow(s, m.pit, report);
}

template <typename State>
std::optional<State> make_move_pit(const State& s, int pit) {
    return make_move(s, pit_move(pit));
}

template <typename State>
std::optional<State> make_move_swap(const State& s) {
    return make_move(s, swap_move());
}

// Uniformly random legal move; empty once no move is available.
template <typename State, typename Rng>
std::optional<std::pair<State, Move>> make_move_random(const State& s, Rng& rng) {
    std::vector<Move> moves = valid_moves(s);
    if (moves.empty()) return std::nullopt;
    std::uniform_int_distribution<std::size_t> pick(0, moves.size() - 1);
    Move m = moves[pick(rng)];
    std::optional<State> next = make_move(s, m);
    if (!next) return std::nullopt;
    return std::make_pair(std::move(*next), m);
}

} // namespace kalah
