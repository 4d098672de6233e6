#pragma once

#include "../core/mancala.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace kalah {

struct IoStatus {
    bool ok = false;
    std::string error;
};

// One training example: a position plus a utility for every move code 0..N
// (Swap first, then Pit 1..N). Moves the search did not report are -inf.
//
// Flat record layout (length 3N + 6):
//   store1, store2, player1 pits..., player2 pits..., turn (1|2), ply,
//   player2 moved (0|1), utility swap, utility pit 1, ..., utility pit N
class Example {
public:
    Example() = default;
    Example(DynGameState state, const std::vector<MoveUtility>& utilities);

    const DynGameState& state() const { return state_; }
    // Indexed by move code; size is pits() + 1.
    const std::vector<float>& utilities() const { return utilities_; }
    float utility(const Move& m) const;

    std::vector<float> to_record() const;

    // Bitwise on utilities, so NaN matches NaN.
    bool operator==(const Example& o) const;
    bool operator!=(const Example& o) const { return !(*this == o); }

private:
    DynGameState state_;
    std::vector<float> utilities_;
};

std::size_t record_length(std::size_t pits);

// Rejects lengths not of the form 3N + 6, negative, fractional or out-of-int counts,
// a turn outside {1, 2} and a moved flag outside {0, 1}.
bool example_from_record(const std::vector<float>& record, Example& out, std::string* reason = nullptr);

class Dataset {
public:
    Dataset() = default;
    explicit Dataset(std::vector<Example> data) : data_(std::move(data)) {}

    const std::vector<Example>& data() const { return data_; }
    std::size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }
    void push_back(Example e) { data_.push_back(std::move(e)); }

    // Pit count of the first example; 0 for an empty dataset.
    std::size_t pits() const;

    Dataset deduplicated() const;
    // One flat record per example, in order.
    std::vector<std::vector<float>> to_records() const;

    IoStatus save_csv(const std::string& path) const;
    IoStatus save_json(const std::string& path) const;

private:
    std::vector<Example> data_;
};

std::string csv_header(std::size_t pits);

// Unparsable numeric cells read as NaN; structural problems are errors.
IoStatus load_csv(const std::string& path, Dataset& out);
IoStatus load_json(const std::string& path, Dataset& out);

// Picks CSV or JSON from the file extension (".json" means JSON).
IoStatus save_dataset(const Dataset& ds, const std::string& path);
IoStatus load_dataset(const std::string& path, Dataset& out);

} // namespace kalah
