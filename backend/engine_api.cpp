#include "engine_api.h"

#include "engine.hpp"
#include "json_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#if defined(__EMSCRIPTEN__)
#include <emscripten/emscripten.h>
#define KALAH_KEEPALIVE EMSCRIPTEN_KEEPALIVE
#else
#define KALAH_KEEPALIVE
#endif

using json = nlohmann::json;

namespace {

std::mutex g_api_mu;
kalah::Session g_session;
bool g_initialized = false;
std::string g_last_error;
std::string g_out;

bool parse_move_string(const char* raw, kalah::Move& out) {
    if (!raw) return false;
    std::string s(raw);
    if (s.empty()) return false;

    json j = json::parse(s, nullptr, false);
    if (j.is_discarded()) return false;
    if (j.is_object()) return kalah::move_from_json(j, out);

    // A bare move code.
    int code = -1;
    if (!kalah::int_from_json(j, code) || code < 0) return false;
    out = kalah::move_from_code(code);
    return true;
}

void set_error(const std::string& msg) {
    g_last_error = msg;
}

void clear_error() {
    g_last_error.clear();
}

const char* set_out_json(const json& body) {
    g_out = body.dump();
    return g_out.c_str();
}

const char* set_out_string(const std::string& body) {
    g_out = body;
    return g_out.c_str();
}

void ensure_initialized_locked() {
    if (g_initialized) return;
    g_session = kalah::new_game(6, 4, "medium");
    g_initialized = true;
}

double seconds_from_ms(int time_ms) {
    return time_ms > 0 ? std::max(0.001, (double)time_ms / 1000.0) : 0.0;
}

} // namespace

extern "C" {

KALAH_KEEPALIVE int kalah_init() {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();
    ensure_initialized_locked();
    return 1;
}

KALAH_KEEPALIVE int kalah_new_game(int pits, int stones, const char* difficulty, int human_player) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();

    if (pits < 1 || stones < 0) {
        set_error("pits must be >= 1 and stones >= 0");
        return 0;
    }
    std::optional<kalah::Player> human = kalah::player_from_number(human_player);
    if (!human) {
        set_error("human_player must be 1 or 2");
        return 0;
    }

    try {
        g_session = kalah::new_game(pits, stones, difficulty ? difficulty : "medium");
        g_session.human_player = *human;
        g_session.bot_player = kalah::opponent(*human);
        g_initialized = true;

        if (g_session.state.current_turn() == g_session.bot_player) {
            if (!kalah::bot_move(g_session)) {
                set_error("bot could not find a legal move");
                return 0;
            }
        }
        return 1;
    } catch (const std::exception& ex) {
        set_error(ex.what());
        return 0;
    }
}

KALAH_KEEPALIVE int kalah_set_position(const char* state_json) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();

    if (!state_json) {
        set_error("missing state string");
        return 0;
    }

    json root = json::parse(state_json, nullptr, false);
    if (root.is_discarded()) {
        set_error("state parse failed; only JSON serialized state is supported");
        return 0;
    }

    kalah::Session parsed;
    std::string why;
    if (!kalah::session_from_json(root, parsed, &why)) {
        set_error("invalid state JSON: " + why);
        return 0;
    }

    g_session = std::move(parsed);
    g_initialized = true;
    return 1;
}

KALAH_KEEPALIVE const char* kalah_get_position() {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();
    ensure_initialized_locked();
    return set_out_json(kalah::state_to_json(kalah::serialize_state(g_session)));
}

KALAH_KEEPALIVE const char* kalah_get_best_move(int time_ms, int depth) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();
    ensure_initialized_locked();

    if (g_session.game_over) {
        set_error("game is already over");
        return set_out_json(json::object());
    }

    try {
        std::optional<kalah::MoveUtility> r = kalah::best_move(g_session, depth, seconds_from_ms(time_ms));
        if (!r) {
            set_error("bot could not find a legal move");
            return set_out_json(json::object());
        }
        json out = kalah::move_to_json(r->move);
        out["utility"] = kalah::utility_to_json(r->utility);
        return set_out_json(out);
    } catch (const std::exception& ex) {
        set_error(ex.what());
        return set_out_json(json::object());
    }
}

KALAH_KEEPALIVE const char* kalah_get_move_utilities(int time_ms, int depth) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();
    ensure_initialized_locked();

    try {
        std::optional<std::vector<kalah::MoveUtility>> all =
            kalah::move_utilities(g_session, depth, seconds_from_ms(time_ms));
        if (!all) {
            set_error(g_session.game_over ? "game is already over" : "search budget exhausted at the root");
            return set_out_json(json::object());
        }
        json list = json::array();
        for (const auto& mu : *all) {
            list.push_back(json{{"move", kalah::move_to_json(mu.move)},
                                {"utility", kalah::utility_to_json(mu.utility)}});
        }
        return set_out_json(json{{"utilities", list}});
    } catch (const std::exception& ex) {
        set_error(ex.what());
        return set_out_json(json::object());
    }
}

KALAH_KEEPALIVE int kalah_apply_move(const char* move) {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();
    ensure_initialized_locked();

    kalah::Move m;
    if (!parse_move_string(move, m)) {
        set_error("missing/invalid move payload");
        return 0;
    }

    kalah::ActionStatus st = kalah::apply_move(g_session, m);
    if (!st.ok) {
        set_error(st.error.empty() ? "illegal move" : st.error);
        return 0;
    }
    return 1;
}

KALAH_KEEPALIVE int kalah_bot_move() {
    std::lock_guard<std::mutex> lk(g_api_mu);
    clear_error();
    ensure_initialized_locked();

    if (g_session.game_over) {
        set_error("game is already over");
        return 0;
    }
    try {
        if (!kalah::bot_move(g_session)) {
            set_error("bot could not find a legal move");
            return 0;
        }
        return 1;
    } catch (const std::exception& ex) {
        set_error(ex.what());
        return 0;
    }
}

KALAH_KEEPALIVE const char* kalah_get_last_error() {
    std::lock_guard<std::mutex> lk(g_api_mu);
    return set_out_string(g_last_error);
}

} // extern "C"
