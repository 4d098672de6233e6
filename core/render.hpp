#pragma once

#include "rules.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace kalah {

inline std::string move_to_string(const Move& m) {
    return m.swap ? std::string("SWAP") : std::to_string(m.pit);
}

// Player One's row is printed right-to-left so the sowing direction reads as a
// counter-clockwise lap around the board.
template <typename State>
std::string render_board(const State& s, const std::string& title = "Kalah") {
    std::ostringstream out;
    const std::string header = title + " (ply " + std::to_string(s.ply()) + ")";
    out << header << "\n" << std::string(header.size(), '=') << "\n";

    const auto& row1 = s.board()[0];
    const auto& row2 = s.board()[1];

    out << (s.current_turn() == Player::One ? '*' : ' ') << " P1:  ("
        << std::setw(2) << std::setfill('0') << s.stores()[0] << ")  [ ";
    for (auto it = row1.rbegin(); it != row1.rend(); ++it) {
        out << std::setw(2) << std::setfill('0') << *it << " ";
    }
    out << "]\n";

    out << (s.current_turn() == Player::Two ? '*' : ' ') << " P2:        [ ";
    for (int pit : row2) out << std::setw(2) << std::setfill('0') << pit << " ";
    out << "]  (" << std::setw(2) << std::setfill('0') << s.stores()[1] << ")\n";

    out << "Valid moves: ";
    std::vector<Move> moves = valid_moves(s);
    if (moves.empty()) {
        out << "none";
    } else {
        // Ascending pits, then swap.
        for (auto it = moves.rbegin(); it != moves.rend(); ++it) {
            if (it->swap) continue;
            out << it->pit << " ";
        }
        if (swap_allowed(s)) out << "SWAP";
    }
    out << "\n";
    return out.str();
}

} // namespace kalah
