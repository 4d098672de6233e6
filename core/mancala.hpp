#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <numeric>
#include <optional>
#include <utility>
#include <vector>

namespace kalah {

enum class Player : uint8_t { One, Two };

// Row/store index: One -> 0, Two -> 1.
inline int index(Player p) { return p == Player::One ? 0 : 1; }

// Human-facing number: One -> 1, Two -> 2.
inline int number(Player p) { return p == Player::One ? 1 : 2; }

inline Player opponent(Player p) { return p == Player::One ? Player::Two : Player::One; }

inline std::optional<Player> player_from_number(int n) {
    if (n == 1) return Player::One;
    if (n == 2) return Player::Two;
    return std::nullopt;
}

struct Move {
    int pit = 0;        // 1-based, ignored for swap
    bool swap = false;

    bool operator==(const Move& o) const { return swap == o.swap && (swap || pit == o.pit); }
    bool operator!=(const Move& o) const { return !(*this == o); }
};

inline Move pit_move(int n) { return Move{n, false}; }
inline Move swap_move() { return Move{0, true}; }

// Swap is 0, Pit(k) is k. Used by the agent protocol and dataset records.
inline int move_code(const Move& m) { return m.swap ? 0 : m.pit; }
inline Move move_from_code(int code) { return code == 0 ? swap_move() : pit_move(code); }

struct MoveUtility {
    Move move;
    float utility = 0.0f;
};

struct Outcome {
    enum class Kind : uint8_t { Winner, Tie, Ongoing };

    Kind kind = Kind::Ongoing;
    Player winner = Player::One;  // meaningful only for Kind::Winner

    static Outcome won_by(Player p) { return Outcome{Kind::Winner, p}; }
    static Outcome tie() { return Outcome{Kind::Tie, Player::One}; }
    static Outcome ongoing() { return Outcome{Kind::Ongoing, Player::One}; }

    bool operator==(const Outcome& o) const {
        return kind == o.kind && (kind != Kind::Winner || winner == o.winner);
    }
    bool operator!=(const Outcome& o) const { return !(*this == o); }
};

// Fixed pit count known at compile time. Copies are plain memcpy, which keeps
// the search free of heap traffic per node.
template <std::size_t N>
class GameState {
public:
    using Row = std::array<int, N>;
    using Board = std::array<Row, 2>;

    static_assert(N > 0, "a board needs at least one pit per player");

    explicit GameState(int stones_per = 4, int store_1 = 0, int store_2 = 0,
                       Player turn = Player::One, int ply = 1, bool player2_moved = false)
        : stores_{store_1, store_2}, ply_(ply), turn_(turn), player2_moved_(player2_moved) {
        board_[0].fill(stones_per);
        board_[1].fill(stones_per);
    }

    GameState(const Board& board, int store_1, int store_2,
              Player turn, int ply, bool player2_moved = false)
        : board_(board), stores_{store_1, store_2}, ply_(ply), turn_(turn),
          player2_moved_(player2_moved) {}

    const Board& board() const { return board_; }
    Board& board_mut() { return board_; }
    const std::array<int, 2>& stores() const { return stores_; }
    std::array<int, 2>& stores_mut() { return stores_; }
    int ply() const { return ply_; }
    int& ply_mut() { return ply_; }
    Player current_turn() const { return turn_; }
    Player& current_turn_mut() { return turn_; }
    bool player2_moved() const { return player2_moved_; }
    void set_player2_moved(bool v) { player2_moved_ = v; }
    static constexpr std::size_t pits() { return N; }

    bool operator==(const GameState& o) const {
        return board_ == o.board_ && stores_ == o.stores_ && ply_ == o.ply_ &&
               turn_ == o.turn_ && player2_moved_ == o.player2_moved_;
    }
    bool operator!=(const GameState& o) const { return !(*this == o); }

private:
    Board board_{};
    std::array<int, 2> stores_{0, 0};
    int ply_ = 1;
    Player turn_ = Player::One;
    bool player2_moved_ = false;
};

// Pit count chosen at runtime; used for configuration, import and the session API.
class DynGameState {
public:
    using Row = std::vector<int>;
    using Board = std::array<Row, 2>;

    DynGameState() : DynGameState(6, 4) {}

    DynGameState(std::size_t pits, int stones_per, int store_1 = 0, int store_2 = 0,
                 Player turn = Player::One, int ply = 1, bool player2_moved = false)
        : board_{Row(pits, stones_per), Row(pits, stones_per)}, stores_{store_1, store_2},
          ply_(ply), turn_(turn), player2_moved_(player2_moved) {}

    const Board& board() const { return board_; }
    Board& board_mut() { return board_; }
    const std::array<int, 2>& stores() const { return stores_; }
    std::array<int, 2>& stores_mut() { return stores_; }
    int ply() const { return ply_; }
    int& ply_mut() { return ply_; }
    Player current_turn() const { return turn_; }
    Player& current_turn_mut() { return turn_; }
    bool player2_moved() const { return player2_moved_; }
    void set_player2_moved(bool v) { player2_moved_ = v; }
    std::size_t pits() const { return board_[0].size(); }

    bool operator==(const DynGameState& o) const {
        return board_ == o.board_ && stores_ == o.stores_ && ply_ == o.ply_ &&
               turn_ == o.turn_ && player2_moved_ == o.player2_moved_;
    }
    bool operator!=(const DynGameState& o) const { return !(*this == o); }

private:
    Board board_;
    std::array<int, 2> stores_{0, 0};
    int ply_ = 1;
    Player turn_ = Player::One;
    bool player2_moved_ = false;
};

// Rejects rows of unequal length, negative stone counts and boards whose
// stone total (or ply counter) would not fit in an int while playing.
inline std::optional<DynGameState> make_dyn_state(DynGameState::Row player1, DynGameState::Row player2,
                                                  int store_1, int store_2, Player turn, int ply,
                                                  bool player2_moved = false) {
    if (player1.size() != player2.size() || player1.empty()) return std::nullopt;
    if (store_1 < 0 || store_2 < 0 || ply < 0) return std::nullopt;
    if (ply == std::numeric_limits<int>::max()) return std::nullopt;

    long long total = (long long)store_1 + store_2;
    for (int v : player1) {
        if (v < 0) return std::nullopt;
        total += v;
    }
    for (int v : player2) {
        if (v < 0) return std::nullopt;
        total += v;
    }
    if (total > std::numeric_limits<int>::max()) return std::nullopt;

    DynGameState out(0, 0, store_1, store_2, turn, ply, player2_moved);
    out.board_mut()[0] = std::move(player1);
    out.board_mut()[1] = std::move(player2);
    return out;
}

inline DynGameState initial_state(std::size_t pits, int stones_per) {
    return DynGameState(pits, stones_per);
}

template <std::size_t N>
DynGameState to_dynamic(const GameState<N>& s) {
    DynGameState out(N, 0, s.stores()[0], s.stores()[1], s.current_turn(), s.ply(), s.player2_moved());
    for (int side = 0; side < 2; side++) {
        for (std::size_t i = 0; i < N; i++) out.board_mut()[side][i] = s.board()[side][i];
    }
    return out;
}

template <std::size_t N>
std::optional<GameState<N>> to_fixed(const DynGameState& s) {
    if (s.board()[0].size() != N || s.board()[1].size() != N) return std::nullopt;
    typename GameState<N>::Board board{};
    for (int side = 0; side < 2; side++) {
        for (std::size_t i = 0; i < N; i++) board[side][i] = s.board()[side][i];
    }
    return GameState<N>(board, s.stores()[0], s.stores()[1], s.current_turn(), s.ply(), s.player2_moved());
}

// Runs `fn` on the fixed-size shape for common board sizes, falling back to
// the dynamic shape otherwise. `fn` must return the same type for every shape.
template <typename Fn>
auto with_fixed_board(const DynGameState& s, Fn&& fn) {
    switch (s.pits()) {
    case 3: return fn(*to_fixed<3>(s));
    case 4: return fn(*to_fixed<4>(s));
    case 5: return fn(*to_fixed<5>(s));
    case 6: return fn(*to_fixed<6>(s));
    case 7: return fn(*to_fixed<7>(s));
    case 8: return fn(*to_fixed<8>(s));
    default: return fn(s);
    }
}

template <typename State>
int stone_total(const State& s) {
    int total = s.stores()[0] + s.stores()[1];
    for (const auto& row : s.board()) total = std::accumulate(row.begin(), row.end(), total);
    return total;
}

} // namespace kalah
