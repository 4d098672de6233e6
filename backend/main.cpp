#include "datagen.hpp"
#include "engine.hpp"
#include "json_codec.hpp"
#include "terminal.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace {

struct Options {
    std::string mode = "pvb";
    int pits = 6;
    int stones = 4;
    std::string difficulty = "medium";
    int depth = 0;     // 0 = difficulty preset
    long time_ms = -1; // -1 = difficulty preset, 0 = no limit
    int bot_player = 2;
    std::string agent_dir = ".";
    std::string agent_name = "agent";
    long agent_timeout_ms = 30000;
    int runs = 100;
    int max_moves = 20;
    int threads = 0;
    unsigned long long seed = 1;
    bool dedup = false;
    std::string out;
};

void print_usage(const char* argv0) {
    std::fprintf(stderr,
                 "usage: %s [--mode pvp|pvb|pve|bve|datagen|search] [options]\n"
                 "  --pits N            pits per player (default 6)\n"
                 "  --stones N          stones per pit (default 4)\n"
                 "  --difficulty D      easy|medium|hard (default medium)\n"
                 "  --depth N           search depth, overrides the difficulty preset\n"
                 "  --time-ms N         search time in ms, 0 for none\n"
                 "  --bot-player 1|2    side played by the bot or agent (default 2)\n"
                 "  --agent-dir DIR     directory for agent state/move files (default .)\n"
                 "  --agent-name NAME   file prefix for agent files (default agent)\n"
                 "  --agent-timeout-ms N\n"
                 "  --runs N            datagen runs (default 100)\n"
                 "  --max-moves N       datagen random opening length bound (default 20)\n"
                 "  --threads N         datagen workers (default KALAH_THREADS or all cores)\n"
                 "  --seed N            datagen seed (default 1)\n"
                 "  --dedup             drop duplicate examples\n"
                 "  --out PATH          datagen output, .json or .csv\n",
                 argv0);
}

bool parse_long(const char* s, long& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

bool parse_int(const char* s, int& out) {
    long v = 0;
    if (!parse_long(s, v) || v < -1000000000L || v > 1000000000L) return false;
    out = (int)v;
    return true;
}

bool parse_u64(const char* s, unsigned long long& out) {
    if (!s || !*s || *s == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

void apply_env_defaults(Options& o) {
    if (const char* t = std::getenv("KALAH_THREADS")) {
        int n = 0;
        if (parse_int(t, n) && n > 0) o.threads = n;
        else std::cerr << "[kalah] ignoring KALAH_THREADS=" << t << "\n";
    }
    if (const char* t = std::getenv("KALAH_AGENT_TIMEOUT_MS")) {
        long ms = 0;
        if (parse_long(t, ms) && ms > 0) o.agent_timeout_ms = ms;
        else std::cerr << "[kalah] ignoring KALAH_AGENT_TIMEOUT_MS=" << t << "\n";
    }
}

bool parse_args(int argc, char** argv, Options& o) {
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "--dedup") {
            o.dedup = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") return false;
        if (i + 1 >= argc) {
            std::cerr << "[kalah] missing value for " << arg << "\n";
            return false;
        }
        const char* v = argv[++i];
        bool ok = true;
        if (arg == "--mode") o.mode = v;
        else if (arg == "--pits") ok = parse_int(v, o.pits) && o.pits >= 1;
        else if (arg == "--stones") ok = parse_int(v, o.stones) && o.stones >= 0;
        else if (arg == "--difficulty") o.difficulty = v;
        else if (arg == "--depth") ok = parse_int(v, o.depth) && o.depth >= 1;
        else if (arg == "--time-ms") ok = parse_long(v, o.time_ms) && o.time_ms >= 0;
        else if (arg == "--bot-player") ok = parse_int(v, o.bot_player) && (o.bot_player == 1 || o.bot_player == 2);
        else if (arg == "--agent-dir") o.agent_dir = v;
        else if (arg == "--agent-name") o.agent_name = v;
        else if (arg == "--agent-timeout-ms") ok = parse_long(v, o.agent_timeout_ms) && o.agent_timeout_ms > 0;
        else if (arg == "--runs") ok = parse_int(v, o.runs) && o.runs >= 0;
        else if (arg == "--max-moves") ok = parse_int(v, o.max_moves) && o.max_moves >= 0;
        else if (arg == "--threads") ok = parse_int(v, o.threads) && o.threads >= 1;
        else if (arg == "--seed") ok = parse_u64(v, o.seed);
        else if (arg == "--out") o.out = v;
        else {
            std::cerr << "[kalah] unknown option " << arg << "\n";
            return false;
        }
        if (!ok) {
            std::cerr << "[kalah] bad value for " << arg << ": " << v << "\n";
            return false;
        }
    }
    const std::string& m = o.mode;
    if (m != "pvp" && m != "pvb" && m != "pve" && m != "bve" && m != "datagen" && m != "search") {
        std::cerr << "[kalah] unknown mode " << m << "\n";
        return false;
    }
    if (m == "datagen" && o.out.empty()) {
        std::cerr << "[kalah] datagen needs --out\n";
        return false;
    }
    return true;
}

// Difficulty preset with --depth / --time-ms applied on top.
kalah::BotSettings bot_settings(const Options& o) {
    const kalah::DifficultyPreset preset = kalah::difficulty_preset(o.difficulty);
    kalah::BotSettings bot;
    bot.depth = o.depth > 0 ? o.depth : preset.depth;
    double seconds = o.time_ms >= 0 ? (double)o.time_ms / 1000.0 : preset.time_limit;
    if (seconds > 0.0) {
        bot.time = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(seconds));
    } else {
        bot.time = std::nullopt;
    }
    return bot;
}

kalah::AgentChannel agent_channel(const Options& o) {
    kalah::AgentChannel ch;
    ch.directory = o.agent_dir;
    ch.name = o.agent_name;
    ch.timeout = std::chrono::milliseconds(o.agent_timeout_ms);
    return ch;
}

int run_datagen(const Options& o) {
    kalah::DatagenConfig cfg;
    cfg.runs = o.runs;
    cfg.max_moves = o.max_moves;
    cfg.pits = o.pits;
    cfg.stones = o.stones;
    cfg.depth = o.depth > 0 ? o.depth : 6;
    cfg.time_limit = o.time_ms > 0 ? (double)o.time_ms / 1000.0 : 0.0;
    cfg.threads = o.threads;
    cfg.seed = o.seed;
    cfg.deduplicate = o.dedup;

    std::string problem = kalah::validate(cfg);
    if (!problem.empty()) {
        std::cerr << "[kalah] " << problem << "\n";
        return 2;
    }

    kalah::Dataset ds = kalah::generate_dataset(cfg);
    kalah::IoStatus st = kalah::save_dataset(ds, o.out);
    if (!st.ok) {
        std::cerr << "[dataset] " << st.error << "\n";
        return 1;
    }
    return 0;
}

// Best move and per-move utilities for the opening position, as JSON on stdout.
int run_search(const Options& o) {
    kalah::Session session = kalah::new_game(o.pits, o.stones, o.difficulty);
    const double seconds = o.time_ms > 0 ? (double)o.time_ms / 1000.0 : 0.0;

    std::optional<kalah::MoveUtility> best = kalah::best_move(session, o.depth, seconds);
    std::optional<std::vector<kalah::MoveUtility>> all = kalah::move_utilities(session, o.depth, seconds);

    json out = kalah::board_state_to_json(session.state);
    out["best"] = best ? kalah::move_to_json(best->move) : json(nullptr);
    json list = json::array();
    if (all) {
        for (const auto& mu : *all) {
            list.push_back(json{{"move", kalah::move_to_json(mu.move)},
                                {"utility", kalah::utility_to_json(mu.utility)}});
        }
    }
    out["utilities"] = list;
    std::cout << out.dump(2) << std::endl;
    return best ? 0 : 1;
}

int exit_code(const kalah::Outcome& o) {
    return o.kind == kalah::Outcome::Kind::Ongoing ? 1 : 0;
}

} // namespace

int main(int argc, char** argv) {
    Options o;
    apply_env_defaults(o);
    if (!parse_args(argc, argv, o)) {
        print_usage(argv[0]);
        return 2;
    }

    if (o.mode == "datagen") return run_datagen(o);
    if (o.mode == "search") return run_search(o);

    const kalah::DynGameState start = kalah::initial_state((std::size_t)o.pits, o.stones);
    const kalah::Player side = o.bot_player == 1 ? kalah::Player::One : kalah::Player::Two;

    if (o.mode == "pvp") return exit_code(kalah::player_v_player(start, std::cin, std::cout));
    if (o.mode == "pvb") {
        return exit_code(kalah::player_v_minimax(start, bot_settings(o), side, std::cin, std::cout));
    }
    if (o.mode == "pve") {
        return exit_code(kalah::player_v_external(start, agent_channel(o), side, std::cin, std::cout));
    }
    // bve: the bot plays --bot-player, the agent the other side.
    return exit_code(kalah::minimax_v_external(start, bot_settings(o), side, agent_channel(o), std::cout));
}
