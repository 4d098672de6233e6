#pragma once

#include "engine.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace kalah {

// False for non-integers and integers outside the int range.
bool int_from_json(const nlohmann::json& v, int& out);

nlohmann::json move_to_json(const Move& m);
bool move_from_json(const nlohmann::json& j, Move& out);

// JSON has no infinities: -inf is written as null, +inf and NaN as strings.
nlohmann::json utility_to_json(float u);
bool utility_from_json(const nlohmann::json& j, float& out);

nlohmann::json board_state_to_json(const DynGameState& s);
bool board_state_from_json(const nlohmann::json& j, DynGameState& out, std::string* reason = nullptr);

nlohmann::json state_to_json(const SerializedState& s);
bool session_from_json(const nlohmann::json& root, Session& out, std::string* reason = nullptr);

} // namespace kalah
