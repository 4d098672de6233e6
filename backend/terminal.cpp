#include "terminal.hpp"

#include "../core/minimax_builder.hpp"
#include "../core/render.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <random>
#include <string>
#include <type_traits>

namespace kalah {
namespace {

static std::string trim_lower(const std::string& raw) {
    size_t b = raw.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = raw.find_last_not_of(" \t\r\n");
    std::string s = raw.substr(b, e - b + 1);
    for (char& ch : s) ch = (char)std::tolower((unsigned char)ch);
    return s;
}

// Names the bot or agent side; the other side is a numbered player.
struct Labels {
    std::optional<Player> named;
    std::string name;
    std::string p1 = "PLAYER 1";
    std::string p2 = "PLAYER 2";

    const std::string& of(Player p) const {
        if (named && *named == p) return name;
        return p == Player::One ? p1 : p2;
    }
};

static Outcome finish(std::ostream& out, const DynGameState& s, const Labels& labels) {
    Outcome o = outcome(s);
    out << render_board(s);
    switch (o.kind) {
    case Outcome::Kind::Winner:
        out << "WINNER: " << labels.of(o.winner) << "\n";
        break;
    case Outcome::Kind::Tie:
        out << "WINNER: TIE\n";
        break;
    case Outcome::Kind::Ongoing:
        out << "WINNER: N/A\n";
        break;
    }
    return o;
}

static std::mt19937& fallback_rng() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    return rng;
}

// Bot turn: search, else a random legal move.
static std::optional<Move> bot_turn(const DynGameState& s, const BotSettings& bot) {
    std::optional<Move> m = bot_choice(s, bot);
    if (m) return m;
    auto step = make_move_random(s, fallback_rng());
    if (!step) return std::nullopt;
    std::cerr << "[kalah] search returned nothing, playing random move " << move_to_string(step->second) << "\n";
    return step->second;
}

} // namespace

std::optional<Move> bot_choice(const DynGameState& s, const BotSettings& bot) {
    return with_fixed_board(s, [&](const auto& fixed) -> std::optional<Move> {
        using State = std::decay_t<decltype(fixed)>;
        MinimaxBuilder<State> b;
        b.optimize_for(fixed.current_turn()).max_depth(bot.depth).max_time(bot.time);
        return b.build().search(fixed);
    });
}

std::optional<Move> read_human_move(const DynGameState& s, std::istream& in, std::ostream& out) {
    const std::vector<Move> legal = valid_moves(s);
    std::string line;
    for (;;) {
        out << "PLAYER " << number(s.current_turn()) << " SELECTION: " << std::flush;
        if (!std::getline(in, line)) return std::nullopt;

        const std::string input = trim_lower(line);
        Move m;
        if (input == "swap") {
            m = swap_move();
        } else {
            char* end = nullptr;
            long pit = std::strtol(input.c_str(), &end, 10);
            if (input.empty() || *end != '\0' || pit < 1 || pit > std::numeric_limits<int>::max()) continue;
            m = pit_move((int)pit);
        }
        if (std::find(legal.begin(), legal.end(), m) != legal.end()) return m;
    }
}

Outcome player_v_player(const DynGameState& start, std::istream& in, std::ostream& out) {
    DynGameState s = start;
    while (!is_over(s)) {
        out << render_board(s);
        std::optional<Move> m = read_human_move(s, in, out);
        if (!m) return Outcome::ongoing();
        s = *make_move(s, *m);
        out << "\n";
    }
    return finish(out, s, Labels{});
}

Outcome player_v_minimax(const DynGameState& start, const BotSettings& bot, Player bot_player,
                         std::istream& in, std::ostream& out) {
    DynGameState s = start;
    while (!is_over(s)) {
        out << render_board(s);
        if (s.current_turn() == bot_player) {
            std::optional<Move> m = bot_turn(s, bot);
            if (!m) return Outcome::ongoing();
            s = *make_move(s, *m);
            out << "MINIMAX SELECTED: " << move_to_string(*m) << "\n\n";
        } else {
            std::optional<Move> m = read_human_move(s, in, out);
            if (!m) return Outcome::ongoing();
            s = *make_move(s, *m);
            out << "\n";
        }
    }
    Labels labels;
    labels.named = bot_player;
    labels.name = "MINIMAX";
    return finish(out, s, labels);
}

Outcome player_v_external(const DynGameState& start, const AgentChannel& agent, Player agent_player,
                          std::istream& in, std::ostream& out) {
    DynGameState s = start;
    while (!is_over(s)) {
        out << render_board(s);
        if (s.current_turn() == agent_player) {
            AgentReply r = request_move(agent, s);
            if (!r.ok) {
                std::cerr << "[agent] " << agent.name << " failed: " << r.error << "\n";
                return Outcome::ongoing();
            }
            s = *make_move(s, r.move);
            out << "AGENT SELECTED: " << move_to_string(r.move) << "\n\n";
        } else {
            std::optional<Move> m = read_human_move(s, in, out);
            if (!m) return Outcome::ongoing();
            s = *make_move(s, *m);
            out << "\n";
        }
    }
    Labels labels;
    labels.named = agent_player;
    labels.name = "AGENT";
    return finish(out, s, labels);
}

Outcome minimax_v_external(const DynGameState& start, const BotSettings& bot, Player bot_player,
                           const AgentChannel& agent, std::ostream& out) {
    DynGameState s = start;
    while (!is_over(s)) {
        out << render_board(s);
        if (s.current_turn() == bot_player) {
            std::optional<Move> m = bot_turn(s, bot);
            if (!m) return Outcome::ongoing();
            s = *make_move(s, *m);
            out << "MINIMAX SELECTED: " << move_to_string(*m) << "\n\n";
        } else {
            AgentReply r = request_move(agent, s);
            if (!r.ok) {
                std::cerr << "[agent] " << agent.name << " failed: " << r.error << "\n";
                return Outcome::ongoing();
            }
            s = *make_move(s, r.move);
            out << "AGENT SELECTED: " << move_to_string(r.move) << "\n\n";
        }
    }
    Labels labels;
    labels.named = bot_player;
    labels.name = "MINIMAX";
    labels.p1 = labels.p2 = "AGENT";
    return finish(out, s, labels);
}

} // namespace kalah
