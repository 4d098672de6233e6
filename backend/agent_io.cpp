#include "agent_io.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <thread>

namespace kalah {
namespace {

static std::string join_path(const std::string& dir, const std::string& file) {
    if (dir.empty()) return file;
    if (dir.back() == '/') return dir + file;
    return dir + "/" + file;
}

static std::optional<Move> first_legal_code(std::istream& in, const std::vector<Move>& legal) {
    std::string token;
    while (in >> token) {
        char* end = nullptr;
        long code = std::strtol(token.c_str(), &end, 10);
        if (end == token.c_str() || *end != '\0' || code < 0 || code > std::numeric_limits<int>::max()) continue;
        Move m = move_from_code((int)code);
        if (std::find(legal.begin(), legal.end(), m) != legal.end()) return m;
    }
    return std::nullopt;
}

} // namespace

std::string state_path(const AgentChannel& ch, int ply) {
    return join_path(ch.directory, ch.name + "_state_" + std::to_string(ply) + ".txt");
}

std::string move_path(const AgentChannel& ch, int ply) {
    return join_path(ch.directory, ch.name + "_move_" + std::to_string(ply) + ".txt");
}

std::vector<int> agent_view(const DynGameState& s) {
    const int me = index(s.current_turn());
    const int them = 1 - me;
    std::vector<int> out;
    out.reserve(2 + 2 * s.pits());
    out.push_back(s.stores()[me]);
    out.push_back(s.stores()[them]);
    out.insert(out.end(), s.board()[me].begin(), s.board()[me].end());
    out.insert(out.end(), s.board()[them].begin(), s.board()[them].end());
    return out;
}

bool write_state(const AgentChannel& ch, const DynGameState& s, std::string* error) {
    const std::string path = state_path(ch, s.ply());
    // Written under a temporary name and renamed so the agent never sees a partial file.
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            if (error) *error = "cannot open " + tmp + " for writing";
            return false;
        }
        std::vector<int> view = agent_view(s);
        for (size_t i = 0; i < view.size(); i++) {
            if (i) out << ' ';
            out << view[i];
        }
        out << '\n';
        out.flush();
        if (!out) {
            if (error) *error = "write to " + tmp + " failed";
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        if (error) *error = "cannot rename " + tmp + " to " + path;
        return false;
    }
    return true;
}

AgentReply read_move(const AgentChannel& ch, const DynGameState& s) {
    AgentReply reply;
    const std::vector<Move> legal = valid_moves(s);
    if (legal.empty()) {
        reply.error = "no legal moves";
        return reply;
    }

    const std::string path = move_path(ch, s.ply());
    const auto deadline = std::chrono::steady_clock::now() + ch.timeout;
    for (;;) {
        std::ifstream in(path);
        if (in) {
            std::optional<Move> m = first_legal_code(in, legal);
            if (m) {
                reply.ok = true;
                reply.move = *m;
                return reply;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(ch.poll_interval);
    }

    reply.error = "timed out waiting for a legal move in " + path;
    std::cerr << "[agent] " << reply.error << "\n";
    return reply;
}

AgentReply request_move(const AgentChannel& ch, const DynGameState& s) {
    AgentReply reply;
    if (!write_state(ch, s, &reply.error)) {
        std::cerr << "[agent] " << reply.error << "\n";
        return reply;
    }
    return read_move(ch, s);
}

} // namespace kalah
