#pragma once

#include "../core/mancala.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kalah {

struct Session {
    DynGameState state;

    bool game_over = false;
    std::string result;

    bool has_last_move = false;
    Move last_move{};
    bool last_move_capture = false;
    Player last_move_player = Player::One;

    // Defaults: human is Player One, bot is Player Two.
    Player human_player = Player::One;
    Player bot_player = Player::Two;
    std::string difficulty = "medium"; // easy | medium | hard

    int bot_depth = 8;
    double bot_time_limit = 2.0;
};

struct ActionStatus {
    bool ok = false;
    std::string error;
    bool game_over = false;
    std::string result;
};

struct SerializedState {
    std::vector<int> stores;
    std::vector<std::vector<int>> board;
    int ply = 1;
    Player turn = Player::One;
    bool player2_moved = false;

    bool game_over = false;
    std::string result;

    bool has_last_move = false;
    Move last_move{};
    bool last_move_capture = false;
    Player last_move_player = Player::One;
    std::string difficulty = "medium";

    std::vector<Move> legal_moves;
};

std::string normalize_difficulty(const std::string& difficulty);

// Search limits for a difficulty name; unknown names get the medium preset.
struct DifficultyPreset {
    int depth = 8;
    double time_limit = 2.0;
};

DifficultyPreset difficulty_preset(const std::string& difficulty);

Session new_game(int pits = 6, int stones = 4, const std::string& difficulty = "medium");

// Wraps an imported position in a session; `result`/`game_over` are derived from it.
Session session_from_state(DynGameState state, const std::string& difficulty = "medium");

ActionStatus apply_move(Session& session, const Move& move);

// Searches for the side to move and plays the result. Empty when the game is over.
std::optional<Move> bot_move(Session& session);

// depth <= 0 / time_limit <= 0 fall back to the session's difficulty settings.
std::optional<MoveUtility> best_move(const Session& session, int depth = 0, double time_limit = 0.0);
std::optional<std::vector<MoveUtility>> move_utilities(const Session& session, int depth = 0,
                                                       double time_limit = 0.0);

SerializedState serialize_state(const Session& session);

std::string outcome_text(const Outcome& o);

} // namespace kalah
