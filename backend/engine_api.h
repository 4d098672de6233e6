#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Initialize internal engine state. Returns 1 on success.
int kalah_init();

// Start a new game. If the bot owns Player One it moves first. Returns 1 on success.
int kalah_new_game(int pits, int stones, const char* difficulty, int human_player);

// Set full game state from JSON (serialized state format). Returns 1 on success.
int kalah_set_position(const char* state_json);

// Get current game state as JSON string.
const char* kalah_get_position();

// Compute best move without mutating game state.
// Returns JSON object string like {"pit":3,"utility":2.0} or {"swap":true,...}.
const char* kalah_get_best_move(int time_ms, int depth);

// Utility of every legal root move: {"utilities":[{"move":{"pit":6},"utility":1.0},...]}.
const char* kalah_get_move_utilities(int time_ms, int depth);

// Apply move from JSON ({"pit":3} / {"swap":true}) or a move code ("3", "0" for swap).
// Returns 1 on success.
int kalah_apply_move(const char* move);

// Let the bot play for the side to move. Returns 1 on success.
int kalah_bot_move();

// Retrieve last API error string.
const char* kalah_get_last_error();

#ifdef __cplusplus
}
#endif
