#include "../backend/agent_io.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

using namespace kalah;

namespace fs = std::filesystem;

static AgentChannel temp_channel(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("kalah_agent_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);

    AgentChannel ch;
    ch.directory = dir.string();
    ch.name = name;
    ch.poll_interval = std::chrono::milliseconds(5);
    ch.timeout = std::chrono::milliseconds(500);
    return ch;
}

static std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

static void write_file(const std::string& path, const std::string& body) {
    std::ofstream out(path);
    out << body;
}

static DynGameState player_two_to_move() {
    std::optional<DynGameState> s = make_dyn_state({1, 2, 3}, {4, 0, 6}, 7, 8, Player::Two, 2);
    assert(s && "Valid position");
    return *s;
}

static void test_paths() {
    AgentChannel ch;
    ch.directory = "/tmp/x/";
    ch.name = "bot";
    assert(state_path(ch, 4) == "/tmp/x/bot_state_4.txt" && "State file per ply");
    assert(move_path(ch, 4) == "/tmp/x/bot_move_4.txt" && "Move file per ply");
}

static void test_state_from_mover_view() {
    AgentChannel ch = temp_channel("view");
    DynGameState s = player_two_to_move();
    std::vector<int> expected{8, 7, 4, 0, 6, 1, 2, 3};
    assert(agent_view(s) == expected && "Player Two sees its own store and row first");

    std::string error;
    assert(write_state(ch, s, &error) && error.empty() && "State written");
    assert(slurp(state_path(ch, 2)) == "8 7 4 0 6 1 2 3\n" && "Whitespace separated numbers");
    fs::remove_all(ch.directory);
}

static void test_first_legal_code_wins() {
    AgentChannel ch = temp_channel("first");
    DynGameState s = player_two_to_move();
    // 2 is an empty pit, 9 is out of range, x is noise; 0 is swap and legal at ply 2.
    write_file(move_path(ch, 2), "2 9 x 0 3\n");
    AgentReply r = read_move(ch, s);
    assert(r.ok && r.move == swap_move() && "First legal code is taken");

    write_file(move_path(ch, 2), "2\n3 1");
    r = read_move(ch, s);
    assert(r.ok && r.move == pit_move(3) && "Codes may span lines");
    fs::remove_all(ch.directory);
}

static void test_timeout_without_legal_move() {
    AgentChannel ch = temp_channel("timeout");
    ch.timeout = std::chrono::milliseconds(60);
    DynGameState s = player_two_to_move();
    write_file(move_path(ch, 2), "2 2 2");

    auto start = std::chrono::steady_clock::now();
    AgentReply r = read_move(ch, s);
    auto waited = std::chrono::steady_clock::now() - start;
    assert(!r.ok && !r.error.empty() && "Only illegal codes times out");
    assert(waited >= std::chrono::milliseconds(60) && "Polling lasts until the timeout");
    fs::remove_all(ch.directory);
}

static void test_request_waits_for_agent() {
    AgentChannel ch = temp_channel("request");
    DynGameState s = player_two_to_move();

    std::thread agent([&]() {
        const std::string state_file = state_path(ch, s.ply());
        while (!fs::exists(state_file)) std::this_thread::sleep_for(std::chrono::milliseconds(2));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        write_file(move_path(ch, s.ply()), "1\n");
    });
    AgentReply r = request_move(ch, s);
    agent.join();

    assert(r.ok && r.move == pit_move(1) && "Reply picked up once written");
    fs::remove_all(ch.directory);
}

static void test_missing_directory() {
    AgentChannel ch;
    ch.directory = (fs::temp_directory_path() / "kalah_agent_missing" / "nested").string();
    ch.timeout = std::chrono::milliseconds(10);
    AgentReply r = request_move(ch, player_two_to_move());
    assert(!r.ok && r.error.find("cannot open") != std::string::npos && "Unwritable state file reported");
}

int main() {
    test_paths();
    test_state_from_mover_view();
    test_first_legal_code_wins();
    test_timeout_without_legal_move();
    test_request_waits_for_agent();
    test_missing_directory();
    std::cout << "All agent tests passed\n";
    return 0;
}
