#pragma once

#include "../core/rules.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace kalah {

// File exchange with an out-of-process player. For every ply the engine writes
//   <directory>/<name>_state_<ply>.txt   "ownStore oppStore ownPits... oppPits..."
// and waits for
//   <directory>/<name>_move_<ply>.txt    whitespace separated move codes (0 = swap, k = pit k)
struct AgentChannel {
    std::string directory = ".";
    std::string name = "agent";
    std::chrono::milliseconds poll_interval{50};
    std::chrono::milliseconds timeout{30000};
};

struct AgentReply {
    bool ok = false;
    Move move{};
    std::string error;
};

std::string state_path(const AgentChannel& ch, int ply);
std::string move_path(const AgentChannel& ch, int ply);

// Board seen from the side to move.
std::vector<int> agent_view(const DynGameState& s);

bool write_state(const AgentChannel& ch, const DynGameState& s, std::string* error = nullptr);

// First code in the file that is legal right now; keeps polling otherwise.
AgentReply read_move(const AgentChannel& ch, const DynGameState& s);

AgentReply request_move(const AgentChannel& ch, const DynGameState& s);

} // namespace kalah
