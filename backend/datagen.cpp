#include "datagen.hpp"

#include "../core/minimax_builder.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
#include <thread>
#include <vector>

namespace kalah {
namespace {

template <std::size_t N>
MinimaxBuilder<GameState<N>> base_builder(const DatagenConfig& cfg) {
    MinimaxBuilder<GameState<N>> b;
    b.max_depth(cfg.depth > 0 ? std::optional<int>(cfg.depth) : std::nullopt);
    if (cfg.time_limit > 0.0) {
        b.max_time(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::duration<double>(cfg.time_limit)));
    }
    return b;
}

// One run: for every opening length n, n random moves then a full root search.
template <std::size_t N>
std::vector<Example> play_run(const DatagenConfig& cfg, int run_index) {
    std::mt19937_64 rng(cfg.seed + (uint64_t)run_index);
    MinimaxBuilder<GameState<N>> builder = base_builder<N>(cfg);
    // One searcher per side to move; built once per run.
    const Minimax<GameState<N>> for_one = builder.optimize_for(Player::One).build();
    const Minimax<GameState<N>> for_two = builder.optimize_for(Player::Two).build();

    std::vector<Example> out;
    for (int n = 0; n < cfg.max_moves; n++) {
        GameState<N> s(cfg.stones);
        for (int i = 0; i < n; i++) {
            auto step = make_move_random(s, rng);
            if (!step) break;
            s = step->first;
        }
        if (is_over(s)) continue;

        const auto& minimax = s.current_turn() == Player::One ? for_one : for_two;
        std::optional<std::vector<MoveUtility>> utils = minimax.search_utility_all(s);
        if (!utils) continue;
        out.push_back(Example(to_dynamic(s), *utils));
    }
    return out;
}

template <std::size_t N>
std::vector<std::vector<Example>> run_all(const DatagenConfig& cfg, int workers) {
    std::vector<std::vector<Example>> per_run((std::size_t)cfg.runs);
    std::atomic<int> next{0};
    std::atomic<int> done{0};

    auto worker = [&]() {
        for (;;) {
            int run = next.fetch_add(1);
            if (run >= cfg.runs) break;
            per_run[(std::size_t)run] = play_run<N>(cfg, run);
            int finished = done.fetch_add(1) + 1;
            if (finished % 10 == 0 || finished == cfg.runs) {
                std::cerr << "[datagen] " << finished << "/" << cfg.runs << " runs\n";
            }
        }
    };

    if (workers == 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve((std::size_t)workers);
        for (int i = 0; i < workers; i++) threads.emplace_back(worker);
        for (auto& t : threads) if (t.joinable()) t.join();
    }
    return per_run;
}

int resolve_threads(const DatagenConfig& cfg) {
    int n = cfg.threads;
    if (n <= 0) n = (int)std::thread::hardware_concurrency();
    if (n <= 0) n = 1;
    return std::max(1, std::min(n, cfg.runs));
}

} // namespace

std::string validate(const DatagenConfig& cfg) {
    if (cfg.pits < 3 || cfg.pits > 8) return "pits must be between 3 and 8";
    if (cfg.stones < 0) return "stones must be >= 0";
    if (cfg.runs < 0) return "runs must be >= 0";
    if (cfg.max_moves < 0) return "max moves must be >= 0";
    if (cfg.depth <= 0 && cfg.time_limit <= 0.0) return "need a depth or a time limit";
    return std::string();
}

Dataset generate_dataset(const DatagenConfig& cfg) {
    std::string problem = validate(cfg);
    if (!problem.empty()) {
        std::cerr << "[datagen] " << problem << "\n";
        return Dataset();
    }
    if (cfg.runs == 0) return Dataset();

    const int workers = resolve_threads(cfg);
    std::cerr << "[datagen] " << cfg.runs << " runs, " << cfg.pits << " pits x " << cfg.stones
              << " stones, depth " << cfg.depth << ", " << workers << " threads, seed " << cfg.seed << "\n";

    auto start = std::chrono::steady_clock::now();
    std::vector<std::vector<Example>> per_run;
    switch (cfg.pits) {
    case 3: per_run = run_all<3>(cfg, workers); break;
    case 4: per_run = run_all<4>(cfg, workers); break;
    case 5: per_run = run_all<5>(cfg, workers); break;
    case 6: per_run = run_all<6>(cfg, workers); break;
    case 7: per_run = run_all<7>(cfg, workers); break;
    default: per_run = run_all<8>(cfg, workers); break;
    }

    Dataset ds;
    for (auto& examples : per_run) {
        for (auto& e : examples) ds.push_back(std::move(e));
    }
    const std::size_t raw = ds.size();
    if (cfg.deduplicate) ds = ds.deduplicated();

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    std::cerr << "[datagen] " << ds.size() << " examples (" << raw << " before dedup) in " << ms << "ms\n";
    return ds;
}

} // namespace kalah
