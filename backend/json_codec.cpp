#include "json_codec.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace kalah {
namespace {

bool fail(std::string* reason, const char* why) {
    if (reason) *reason = why;
    return false;
}

// Stone counts: integers in [0, INT_MAX].
bool read_row(const json& j, std::vector<int>& out) {
    if (!j.is_array()) return false;
    out.clear();
    for (const auto& v : j) {
        int count = 0;
        if (!int_from_json(v, count) || count < 0) return false;
        out.push_back(count);
    }
    return true;
}

} // namespace

bool int_from_json(const json& v, int& out) {
    if (v.is_number_unsigned()) {
        const uint64_t u = v.get<uint64_t>();
        if (u > (uint64_t)std::numeric_limits<int>::max()) return false;
        out = (int)u;
        return true;
    }
    if (!v.is_number_integer()) return false;
    const int64_t i = v.get<int64_t>();
    if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) return false;
    out = (int)i;
    return true;
}

json move_to_json(const Move& m) {
    if (m.swap) return json{{"swap", true}};
    return json{{"pit", m.pit}};
}

bool move_from_json(const json& j, Move& out) {
    if (!j.is_object()) return false;
    if (j.contains("swap") && j.at("swap").is_boolean() && j.at("swap").get<bool>()) {
        out = swap_move();
        return true;
    }
    int value = 0;
    if (j.contains("pit") && int_from_json(j.at("pit"), value)) {
        out = pit_move(value);
        return true;
    }
    if (j.contains("code") && int_from_json(j.at("code"), value)) {
        int code = value;
        if (code < 0) return false;
        out = move_from_code(code);
        return true;
    }
    return false;
}

json utility_to_json(float u) {
    if (std::isnan(u)) return json("nan");
    if (std::isinf(u)) return u < 0 ? json(nullptr) : json("inf");
    return json(u);
}

bool utility_from_json(const json& j, float& out) {
    if (j.is_null()) {
        out = -std::numeric_limits<float>::infinity();
        return true;
    }
    if (j.is_number()) {
        out = j.get<float>();
        return true;
    }
    if (j.is_string()) {
        const std::string s = j.get<std::string>();
        if (s == "inf") out = std::numeric_limits<float>::infinity();
        else if (s == "-inf") out = -std::numeric_limits<float>::infinity();
        else if (s == "nan") out = std::numeric_limits<float>::quiet_NaN();
        else return false;
        return true;
    }
    return false;
}

json board_state_to_json(const DynGameState& s) {
    return json{
        {"pits", s.pits()},
        {"stores", {s.stores()[0], s.stores()[1]}},
        {"board", {s.board()[0], s.board()[1]}},
        {"ply", s.ply()},
        {"turn", number(s.current_turn())},
        {"player2_moved", s.player2_moved()}
    };
}

bool board_state_from_json(const json& j, DynGameState& out, std::string* reason) {
    if (!j.is_object()) return fail(reason, "state is not an object");
    if (!j.contains("board") || !j.at("board").is_array() || j.at("board").size() != 2)
        return fail(reason, "board must hold two rows");
    if (!j.contains("stores") || !j.at("stores").is_array() || j.at("stores").size() != 2)
        return fail(reason, "stores must hold two values");

    std::vector<int> row1;
    std::vector<int> row2;
    if (!read_row(j.at("board")[0], row1) || !read_row(j.at("board")[1], row2))
        return fail(reason, "board rows must hold integer counts between 0 and 2147483647");

    const json& stores = j.at("stores");
    int store_1 = 0;
    int store_2 = 0;
    if (!int_from_json(stores[0], store_1) || !int_from_json(stores[1], store_2) || store_1 < 0 || store_2 < 0)
        return fail(reason, "stores must be integer counts between 0 and 2147483647");

    int ply = 1;
    int turn = 1;
    if (j.contains("ply") && !int_from_json(j.at("ply"), ply)) return fail(reason, "ply must be an int");
    if (j.contains("turn") && !int_from_json(j.at("turn"), turn)) return fail(reason, "turn must be 1 or 2");
    std::optional<Player> p = player_from_number(turn);
    if (!p) return fail(reason, "turn must be 1 or 2");

    bool p2_moved = false;
    if (j.contains("player2_moved")) {
        if (!j.at("player2_moved").is_boolean()) return fail(reason, "player2_moved must be a boolean");
        p2_moved = j.at("player2_moved").get<bool>();
    }

    std::optional<DynGameState> s =
        make_dyn_state(std::move(row1), std::move(row2), store_1, store_2, *p, ply, p2_moved);
    if (!s) return fail(reason, "rows differ in length, ply is out of range or the stone total overflows");
    out = std::move(*s);
    return true;
}

json state_to_json(const SerializedState& s) {
    json legal = json::array();
    for (const auto& m : s.legal_moves) legal.push_back(move_to_json(m));

    return json{
        {"pits", s.board.empty() ? std::size_t(0) : s.board[0].size()},
        {"stores", s.stores},
        {"board", s.board},
        {"ply", s.ply},
        {"turn", number(s.turn)},
        {"player2_moved", s.player2_moved},
        {"game_over", s.game_over},
        {"result", s.result},
        {"legal_moves", legal},
        {"has_last_move", s.has_last_move},
        {"last_move", move_to_json(s.last_move)},
        {"last_move_capture", s.last_move_capture},
        {"last_move_player", number(s.last_move_player)},
        {"difficulty", s.difficulty}
    };
}

bool session_from_json(const json& root, Session& out, std::string* reason) {
    DynGameState state;
    if (!board_state_from_json(root, state, reason)) return false;

    std::string difficulty = "medium";
    if (root.contains("difficulty") && root.at("difficulty").is_string()) {
        difficulty = root.at("difficulty").get<std::string>();
    }
    Session tmp = session_from_state(std::move(state), difficulty);

    int side = 0;
    if (root.contains("human_player") && root.at("human_player").is_number_integer()) {
        if (!int_from_json(root.at("human_player"), side)) return fail(reason, "human_player must be 1 or 2");
        std::optional<Player> human = player_from_number(side);
        if (!human) return fail(reason, "human_player must be 1 or 2");
        tmp.human_player = *human;
        tmp.bot_player = opponent(*human);
    }

    if (root.contains("last_move") && root.at("last_move").is_object()) {
        Move lm;
        if (move_from_json(root.at("last_move"), lm)) {
            tmp.last_move = lm;
            tmp.has_last_move = true;
        }
    }
    if (root.contains("has_last_move") && root.at("has_last_move").is_boolean()) {
        tmp.has_last_move = tmp.has_last_move && root.at("has_last_move").get<bool>();
    }
    if (root.contains("last_move_capture") && root.at("last_move_capture").is_boolean()) {
        tmp.last_move_capture = root.at("last_move_capture").get<bool>();
    }
    if (root.contains("last_move_player") && int_from_json(root.at("last_move_player"), side)) {
        std::optional<Player> lp = player_from_number(side);
        if (lp) tmp.last_move_player = *lp;
    }

    out = std::move(tmp);
    return true;
}

} // namespace kalah
