#pragma once

#include "agent_io.hpp"

#include <chrono>
#include <iosfwd>
#include <optional>

namespace kalah {

struct BotSettings {
    std::optional<int> depth = 12;
    std::optional<std::chrono::nanoseconds> time;
};

// Search for the side to move; empty only when no move is legal.
std::optional<Move> bot_choice(const DynGameState& s, const BotSettings& bot);

// Reads "swap" or a pit number, re-prompting until the move is legal.
// Empty when the input stream runs dry.
std::optional<Move> read_human_move(const DynGameState& s, std::istream& in, std::ostream& out);

// Each loop plays until is_over and returns the outcome. Input ending early or an
// agent failure returns Outcome::ongoing().
Outcome player_v_player(const DynGameState& start, std::istream& in, std::ostream& out);
Outcome player_v_minimax(const DynGameState& start, const BotSettings& bot, Player bot_player,
                         std::istream& in, std::ostream& out);
Outcome player_v_external(const DynGameState& start, const AgentChannel& agent, Player agent_player,
                          std::istream& in, std::ostream& out);
Outcome minimax_v_external(const DynGameState& start, const BotSettings& bot, Player bot_player,
                           const AgentChannel& agent, std::ostream& out);

} // namespace kalah
