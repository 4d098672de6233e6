#include "../backend/engine.hpp"
#include "../backend/engine_api.h"
#include "../backend/json_codec.hpp"
#include "../core/rules.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <iostream>
#include <limits>
#include <string>

using namespace kalah;
using json = nlohmann::json;

static void test_difficulty_presets() {
    Session easy = new_game(6, 4, "Easy");
    assert(easy.difficulty == "easy" && easy.bot_depth == 4 && easy.bot_time_limit == 0.5 && "Easy preset");
    Session hard = new_game(6, 4, "expert");
    assert(hard.difficulty == "hard" && hard.bot_depth == 12 && "Expert maps to hard");
    Session other = new_game(6, 4, "whatever");
    assert(other.difficulty == "medium" && other.bot_depth == 8 && other.bot_time_limit == 2.0 &&
           "Unknown names fall back to medium");
}

static void test_difficulty_preset_table() {
    DifficultyPreset easy = difficulty_preset("BEGINNER");
    assert(easy.depth == 4 && easy.time_limit == 0.5 && "Beginner is the easy preset");
    DifficultyPreset hard = difficulty_preset("hard");
    assert(hard.depth == 12 && hard.time_limit == 5.0 && "Hard preset");
    DifficultyPreset fallback = difficulty_preset("");
    assert(fallback.depth == 8 && fallback.time_limit == 2.0 && "Empty name is medium");
    Session s = new_game(6, 4, "hard");
    assert(s.bot_depth == hard.depth && s.bot_time_limit == hard.time_limit && "Sessions use the same table");
}

static void test_apply_move_errors() {
    Session s = new_game(6, 4, "easy");
    ActionStatus st = apply_move(s, swap_move());
    assert(!st.ok && st.error == "swap is not allowed now" && "No swap at ply 1");
    st = apply_move(s, pit_move(7));
    assert(!st.ok && st.error == "pit out of range" && "Pit past the row");
    assert(s.state == DynGameState() && !s.has_last_move && "Rejected moves leave the session as it was");

    st = apply_move(s, pit_move(3));
    assert(st.ok && !st.game_over && "Opening move accepted");
    assert(s.has_last_move && s.last_move == pit_move(3) && s.last_move_player == Player::One && "Last move kept");
    st = apply_move(s, pit_move(3));
    assert(!st.ok && st.error == "pit is empty" && "Pit 3 was just emptied");
}

static void test_game_over_session() {
    std::optional<DynGameState> s = make_dyn_state({0, 0, 1}, {2, 0, 0}, 3, 3, Player::One, 7);
    Session session = session_from_state(*s, "easy");
    ActionStatus st = apply_move(session, pit_move(3));
    assert(st.ok && st.game_over && st.result == "Player 2 wins." && "Sweep ends the game");
    st = apply_move(session, pit_move(1));
    assert(!st.ok && st.error == "game is already over" && "No moves after the end");
    assert(!bot_move(session) && !best_move(session) && "Bot has nothing to play");
    assert(serialize_state(session).legal_moves.empty() && "No legal moves listed");
}

static void test_best_move_and_utilities() {
    Session s = new_game(4, 3, "easy");
    std::optional<MoveUtility> best = best_move(s, 3, 0.0);
    assert(best && make_move(s.state, best->move) && "Best move is legal");

    std::optional<std::vector<MoveUtility>> all = move_utilities(s, 3, 0.0);
    assert(all && all->size() == valid_moves(s.state).size() && "One utility per legal move");

    const DynGameState before = s.state;
    std::optional<Move> played = bot_move(s);
    assert(played && s.state != before && s.last_move == *played && "bot_move plays its choice");
}

static void test_large_board_uses_dynamic_shape() {
    Session s = new_game(10, 2, "easy");
    std::optional<MoveUtility> best = best_move(s, 2, 0.0);
    assert(best && make_move(s.state, best->move) && "Boards outside 3..8 still search");
}

static std::string last_error() {
    return std::string(kalah_get_last_error());
}

static void test_c_api_flow() {
    assert(kalah_init() == 1 && "init succeeds");
    assert(kalah_new_game(6, 4, "easy", 1) == 1 && "new game succeeds");

    json pos = json::parse(kalah_get_position());
    assert(pos["ply"] == 1 && pos["turn"] == 1 && pos["pits"] == 6 && "Fresh position");
    assert(pos["legal_moves"].size() == 6 && "Six pits playable");

    assert(kalah_apply_move("{\"pit\":3}") == 1 && "JSON move accepted");
    pos = json::parse(kalah_get_position());
    assert(pos["turn"] == 1 && pos["ply"] == 2 && pos["stores"][0] == 1 && "Bonus turn after pit 3");

    assert(kalah_apply_move("0") == 0 && last_error() == "swap is not allowed now" && "Swap code rejected");
    assert(kalah_apply_move("garbage") == 0 && !last_error().empty() && "Unreadable move rejected");
    assert(kalah_apply_move("6") == 1 && last_error().empty() && "Move code accepted");

    json best = json::parse(kalah_get_best_move(0, 2));
    assert((best.contains("pit") || best.contains("swap")) && best.contains("utility") && "Best move reported");

    json utils = json::parse(kalah_get_move_utilities(0, 2));
    assert(utils["utilities"].is_array() && !utils["utilities"].empty() && "Utilities reported");
}

static void test_c_api_bot_opens() {
    assert(kalah_new_game(6, 4, "easy", 2) == 1 && "Bot plays Player One");
    json pos = json::parse(kalah_get_position());
    assert(pos["has_last_move"] == true && pos["last_move_player"] == 1 && "Bot already moved");
    assert(kalah_new_game(6, 4, "easy", 3) == 0 && last_error() == "human_player must be 1 or 2" &&
           "Bad side rejected");
}

static void test_c_api_set_position() {
    const char* state = R"({"board":[[0,0,2],[1,1,0]],"stores":[4,5],"ply":9,"turn":2,"player2_moved":true})";
    assert(kalah_set_position(state) == 1 && "Position accepted");
    json pos = json::parse(kalah_get_position());
    assert(pos["pits"] == 3 && pos["turn"] == 2 && pos["ply"] == 9 && pos["player2_moved"] == true &&
           "Position read back");

    std::string round_trip = kalah_get_position();
    assert(kalah_set_position(round_trip.c_str()) == 1 && "Serialized state is accepted back");

    assert(kalah_set_position("{not json") == 0 && !last_error().empty() && "Parse failure reported");
    assert(kalah_set_position(R"({"board":[[1],[1,1]],"stores":[0,0]})") == 0 && "Ragged board rejected");
    assert(kalah_set_position(R"({"board":[[1],[1]],"stores":[0,0],"turn":5})") == 0 && "Bad turn rejected");

    assert(kalah_bot_move() == 1 && "Bot moves from an imported position");
}

static void test_c_api_rejects_out_of_range_counts() {
    assert(kalah_new_game(3, 4, "easy", 1) == 1 && "Fresh game");
    const std::string before = kalah_get_position();

    assert(kalah_set_position(R"({"board":[[4294967297,4,4],[4,4,4]],"stores":[0,0]})") == 0 &&
           !last_error().empty() && "Pit count past the int range is refused, not wrapped");
    assert(kalah_set_position(R"({"board":[[4,4,4],[4,4,4]],"stores":[-9223372036854775808,0]})") == 0 &&
           "Store below the int range refused");
    assert(kalah_set_position(R"({"board":[[4,4,4],[4,4,4]],"stores":[2147483647,0]})") == 0 &&
           "Stone total that would overflow while sowing refused");
    assert(kalah_set_position(R"({"board":[[1],[1]],"stores":[0,0],"ply":2147483648})") == 0 &&
           "Ply past the int range refused");
    assert(std::string(kalah_get_position()) == before && "Rejected imports leave the game alone");

    assert(kalah_set_position(R"({"board":[[0,0,1],[0,0,0]],"stores":[2147483646,0]})") == 1 &&
           "Largest total that fits is accepted");

    assert(kalah_new_game(6, 4, "easy", 1) == 1 && "Fresh game");
    assert(kalah_apply_move("4294967297") == 0 && "Move code past the int range refused");
    assert(kalah_apply_move(R"({"pit":4294967297})") == 0 && "Pit past the int range refused");
    json pos = json::parse(kalah_get_position());
    assert(pos["ply"] == 1 && "No move was played");
}

static void test_json_codec() {
    Move m;
    assert(move_from_json(json{{"swap", true}}, m) && m == swap_move() && "Swap object");
    assert(move_from_json(json{{"code", 4}}, m) && m == pit_move(4) && "Move code object");
    assert(!move_from_json(json::array(), m) && "Arrays are not moves");

    int v = 0;
    assert(int_from_json(json(2147483647), v) && v == 2147483647 && "INT_MAX fits");
    assert(!int_from_json(json(2147483648LL), v) && "One past INT_MAX");
    assert(!int_from_json(json(1.0), v) && "Floats are not ints");

    float u = 0.0f;
    assert(utility_to_json(-std::numeric_limits<float>::infinity()).is_null() && "-inf is null");
    assert(utility_from_json(json(nullptr), u) && u == -std::numeric_limits<float>::infinity() && "null is -inf");
    assert(utility_from_json(json(2.5), u) && u == 2.5f && "Plain numbers");
}

int main() {
    test_difficulty_presets();
    test_difficulty_preset_table();
    test_apply_move_errors();
    test_game_over_session();
    test_best_move_and_utilities();
    test_large_board_uses_dynamic_shape();
    test_c_api_flow();
    test_c_api_bot_opens();
    test_c_api_set_position();
    test_c_api_rejects_out_of_range_counts();
    test_json_codec();
    std::cout << "All engine tests passed\n";
    return 0;
}
