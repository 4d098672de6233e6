#include "engine.hpp"

#include "../core/minimax_builder.hpp"
#include "../core/render.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <type_traits>

namespace kalah {
namespace {

static std::string to_lower_ascii(std::string s) {
    for (char& ch : s) ch = (char)std::tolower((unsigned char)ch);
    return s;
}

static void apply_difficulty_to_session(Session& session) {
    session.difficulty = normalize_difficulty(session.difficulty);
    const DifficultyPreset p = difficulty_preset(session.difficulty);
    session.bot_depth = p.depth;
    session.bot_time_limit = p.time_limit;
}

static void refresh_result(Session& session) {
    Outcome o = outcome(session.state);
    session.game_over = o.kind != Outcome::Kind::Ongoing;
    session.result = session.game_over ? outcome_text(o) : std::string();
}

template <typename State>
static MinimaxBuilder<State> builder_for(const State& s, int depth, double time_limit) {
    MinimaxBuilder<State> b;
    b.optimize_for(s.current_turn()).max_depth(depth);
    if (time_limit > 0.0) {
        b.max_time(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::duration<double>(time_limit)));
    } else {
        b.max_time(std::nullopt);
    }
    return b;
}

static int effective_depth(const Session& session, int depth) {
    return depth > 0 ? depth : std::max(1, session.bot_depth);
}

static double effective_time(const Session& session, double time_limit) {
    return time_limit > 0.0 ? time_limit : session.bot_time_limit;
}

} // namespace

std::string normalize_difficulty(const std::string& difficulty) {
    std::string d = to_lower_ascii(difficulty);
    if (d == "easy" || d == "beginner") return "easy";
    if (d == "hard" || d == "expert") return "hard";
    return "medium";
}

DifficultyPreset difficulty_preset(const std::string& difficulty) {
    const std::string name = normalize_difficulty(difficulty);
    DifficultyPreset p;
    if (name == "easy") {
        p.depth = 4;
        p.time_limit = 0.5;
    } else if (name == "hard") {
        p.depth = 12;
        p.time_limit = 5.0;
    }
    return p;
}

std::string outcome_text(const Outcome& o) {
    switch (o.kind) {
    case Outcome::Kind::Winner:
        return "Player " + std::to_string(number(o.winner)) + " wins.";
    case Outcome::Kind::Tie:
        return "Tie.";
    case Outcome::Kind::Ongoing:
        break;
    }
    return std::string();
}

Session new_game(int pits, int stones, const std::string& difficulty) {
    Session out;
    out.state = initial_state((std::size_t)std::max(1, pits), std::max(0, stones));
    out.difficulty = difficulty;
    apply_difficulty_to_session(out);
    refresh_result(out);
    return out;
}

Session session_from_state(DynGameState state, const std::string& difficulty) {
    Session out;
    out.state = std::move(state);
    out.difficulty = difficulty;
    apply_difficulty_to_session(out);
    refresh_result(out);
    return out;
}

ActionStatus apply_move(Session& session, const Move& move) {
    ActionStatus st;
    st.ok = false;

    if (session.game_over) {
        st.error = "game is already over";
        st.game_over = true;
        st.result = session.result;
        return st;
    }

    MoveReport report;
    std::optional<DynGameState> next = make_move(session.state, move, &report);
    if (!next) {
        if (move.swap) st.error = "swap is not allowed now";
        else if (move.pit < 1 || move.pit > (int)session.state.pits()) st.error = "pit out of range";
        else st.error = "pit is empty";
        return st;
    }

    session.has_last_move = true;
    session.last_move = move;
    session.last_move_capture = report.captured > 0;
    session.last_move_player = session.state.current_turn();
    session.state = std::move(*next);
    refresh_result(session);

    st.ok = true;
    st.game_over = session.game_over;
    st.result = session.result;
    return st;
}

std::optional<MoveUtility> best_move(const Session& session, int depth, double time_limit) {
    if (session.game_over) return std::nullopt;
    const int d = effective_depth(session, depth);
    const double t = effective_time(session, time_limit);

    return with_fixed_board(session.state, [&](const auto& s) -> std::optional<MoveUtility> {
        using State = std::decay_t<decltype(s)>;
        Minimax<State> minimax = builder_for(s, d, t).build();
        SearchStats stats;
        auto start = std::chrono::steady_clock::now();
        std::optional<MoveUtility> r = minimax.search_utility_with_stats(s, stats);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (r) {
            std::cerr << "[search] player " << number(s.current_turn()) << " depth " << d
                      << " move " << move_to_string(r->move) << " utility " << r->utility
                      << " nodes " << stats.nodes << " cutoffs " << stats.cutoffs
                      << " in " << ms << "ms\n";
        }
        return r;
    });
}

std::optional<std::vector<MoveUtility>> move_utilities(const Session& session, int depth, double time_limit) {
    if (session.game_over) return std::nullopt;
    const int d = effective_depth(session, depth);
    const double t = effective_time(session, time_limit);

    return with_fixed_board(session.state, [&](const auto& s) -> std::optional<std::vector<MoveUtility>> {
        return builder_for(s, d, t).build().search_utility_all(s);
    });
}

std::optional<Move> bot_move(Session& session) {
    if (session.game_over) return std::nullopt;

    std::optional<MoveUtility> found = best_move(session);
    if (!found) return std::nullopt;

    ActionStatus st = apply_move(session, found->move);
    if (!st.ok) {
        std::cerr << "[search] engine picked an illegal move: " << st.error << "\n";
        return std::nullopt;
    }
    return found->move;
}

SerializedState serialize_state(const Session& session) {
    SerializedState out;
    const DynGameState& s = session.state;
    out.stores = {s.stores()[0], s.stores()[1]};
    out.board = {s.board()[0], s.board()[1]};
    out.ply = s.ply();
    out.turn = s.current_turn();
    out.player2_moved = s.player2_moved();
    out.game_over = session.game_over;
    out.result = session.result;
    out.has_last_move = session.has_last_move;
    out.last_move = session.last_move;
    out.last_move_capture = session.last_move_capture;
    out.last_move_player = session.last_move_player;
    out.difficulty = normalize_difficulty(session.difficulty);

    if (session.game_over) return out;
    out.legal_moves = valid_moves(s);
    return out;
}

} // namespace kalah
