#pragma once

#include "dataset.hpp"

#include <cstdint>

namespace kalah {

struct DatagenConfig {
    int runs = 100;
    int max_moves = 20;
    int pits = 6;      // 3..8
    int stones = 4;
    int depth = 6;
    double time_limit = 0.0;  // seconds; <= 0 means no time limit
    int threads = 0;          // <= 0 means hardware concurrency
    uint64_t seed = 1;
    bool deduplicate = false;
};

// Empty string when the config is usable.
std::string validate(const DatagenConfig& cfg);

// Plays random openings and records search utilities for every reached
// position. Output order follows run index, then opening length.
Dataset generate_dataset(const DatagenConfig& cfg);

} // namespace kalah
