#include "../backend/datagen.hpp"
#include "../backend/dataset.hpp"
#include "../core/rules.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>

using namespace kalah;

namespace fs = std::filesystem;

static const float kNegInf = -std::numeric_limits<float>::infinity();

static std::string temp_file(const std::string& name) {
    return (fs::temp_directory_path() / ("kalah_test_" + name)).string();
}

static Example sample_example() {
    std::optional<DynGameState> s = make_dyn_state({0, 3, 1}, {2, 0, 4}, 5, 1, Player::Two, 4, true);
    assert(s && "Sample state is valid");
    return Example(*s, {MoveUtility{pit_move(3), 1.5f}, MoveUtility{pit_move(1), -2.25f}});
}

static void test_example_pads_missing_moves() {
    Example e = sample_example();
    assert(e.utilities().size() == 4 && "One slot per move code 0..N");
    assert(e.utility(swap_move()) == kNegInf && "Swap was not reported");
    assert(e.utility(pit_move(2)) == kNegInf && "Pit 2 was not reported");
    assert(e.utility(pit_move(3)) == 1.5f && e.utility(pit_move(1)) == -2.25f && "Reported values kept");
}

static void test_record_layout() {
    Example e = sample_example();
    std::vector<float> rec = e.to_record();
    assert(rec.size() == record_length(3) && rec.size() == 15 && "3N + 6 fields");
    std::vector<float> expected{5, 1, 0, 3, 1, 2, 0, 4, 2, 4, 1, kNegInf, -2.25f, kNegInf, 1.5f};
    assert(rec == expected && "Stores, rows, turn, ply, flag, then utilities by move code");

    Example back;
    assert(example_from_record(rec, back) && back == e && "Record reads back to the same example");
}

static void test_record_rejections() {
    std::vector<float> rec = sample_example().to_record();
    Example out;
    std::string why;

    std::vector<float> short_rec(rec.begin(), rec.end() - 1);
    assert(!example_from_record(short_rec, out, &why) && !why.empty() && "Length must be 3N + 6");
    assert(!example_from_record(std::vector<float>(6, 0.0f), out) && "At least one pit per row");

    std::vector<float> bad = rec;
    bad[8] = 3.0f;
    assert(!example_from_record(bad, out) && "Turn must be 1 or 2");
    bad = rec;
    bad[10] = 0.5f;
    assert(!example_from_record(bad, out) && "Flag must be 0 or 1");
    bad = rec;
    bad[3] = -1.0f;
    assert(!example_from_record(bad, out) && "Negative pit rejected");
    bad = rec;
    bad[4] = 1.5f;
    assert(!example_from_record(bad, out) && "Fractional pit rejected");
    bad = rec;
    bad[3] = 3.0e9f;
    assert(!example_from_record(bad, out, &why) && "Pit past the int range rejected");
    bad = rec;
    bad[0] = 2147483520.0f;
    assert(!example_from_record(bad, out, &why) && why.find("int") != std::string::npos &&
           "Stores plus pits past INT_MAX rejected");
    bad = rec;
    bad[9] = 2147483648.0f;
    assert(!example_from_record(bad, out) && "Ply past the int range rejected");
}

static void test_to_records() {
    Example a = sample_example();
    Example b(*make_dyn_state({2, 0, 0}, {0, 1, 0}, 3, 3, Player::One, 6), {MoveUtility{pit_move(1), 4.0f}});
    std::vector<std::vector<float>> recs = Dataset({a, b, a}).to_records();
    assert(recs.size() == 3 && "One record per example");
    assert(recs[0] == a.to_record() && recs[1] == b.to_record() && recs[2] == recs[0] && "Records keep order");
    assert(Dataset().to_records().empty() && "Empty dataset has no records");
}

static void test_deduplicate() {
    Example a = sample_example();
    Example nan_a(a.state(), {MoveUtility{pit_move(1), std::numeric_limits<float>::quiet_NaN()}});
    Dataset ds({a, a, nan_a, nan_a, a});
    Dataset unique = ds.deduplicated();
    assert(unique.size() == 2 && "Copies collapse, NaN utilities included");
    assert(unique.data()[0] == a && unique.data()[1] == nan_a && "First occurrence order is kept");
    assert(nan_a == nan_a && "NaN matches NaN bitwise");
}

static void test_csv_round_trip() {
    Example a = sample_example();
    Example b(*make_dyn_state({1, 1, 1}, {0, 0, 7}, 0, 0, Player::One, 1), {MoveUtility{pit_move(2), 0.1f}});
    Dataset ds({a, b});

    const std::string path = temp_file("round_trip.csv");
    IoStatus st = save_dataset(ds, path);
    assert(st.ok && "CSV save succeeds");

    std::ifstream in(path);
    std::string header;
    std::getline(in, header);
    assert(header == csv_header(3) && "Header names every column");
    assert(header == "store1,store2,player1p1,player1p2,player1p3,player2p1,player2p2,player2p3,"
                     "turn,ply,p2_moved,util_swap,util_1,util_2,util_3" &&
           "Header layout");
    in.close();

    Dataset loaded;
    st = load_dataset(path, loaded);
    assert(st.ok && loaded.size() == 2 && "CSV load succeeds");
    assert(loaded.data()[0] == a && loaded.data()[1] == b && "Floats survive the text format exactly");
    std::remove(path.c_str());
}

static void test_csv_unparsable_cells_and_bad_rows() {
    const std::string path = temp_file("legacy.csv");
    {
        std::ofstream out(path);
        out << csv_header(3) << "\n";
        out << "5,1,0,3,1,2,0,4,2,4,1,-inf,oops,-inf,1.5\n";
    }
    Dataset loaded;
    IoStatus st = load_csv(path, loaded);
    assert(st.ok && loaded.size() == 1 && "Unparsable utility still loads");
    assert(std::isnan(loaded.data()[0].utility(pit_move(1))) && "Unparsable cell reads as NaN");

    {
        std::ofstream out(path);
        out << csv_header(3) << "\n";
        out << "5,1,0,3,1,2,0,4,2,4,1,-inf\n";
    }
    st = load_csv(path, loaded);
    assert(!st.ok && !st.error.empty() && "Short row is rejected");

    {
        std::ofstream out(path);
        out << csv_header(3) << "\n";
        out << "5,1,0,3,1,2,0,4,7,4,1,-inf,0,-inf,1.5\n";
    }
    st = load_csv(path, loaded);
    assert(!st.ok && "Invalid turn is rejected");
    std::remove(path.c_str());

    st = load_csv(temp_file("does_not_exist.csv"), loaded);
    assert(!st.ok && "Missing file reported");
}

static void test_json_round_trip() {
    Example a = sample_example();
    Dataset ds({a});
    const std::string path = temp_file("round_trip.json");
    IoStatus st = save_dataset(ds, path);
    assert(st.ok && "JSON save succeeds");

    Dataset loaded;
    st = load_dataset(path, loaded);
    assert(st.ok && loaded.size() == 1 && "JSON load succeeds");
    assert(loaded.data()[0] == a && "-inf comes back from null");
    assert(loaded.pits() == 3 && "Pit count from the examples");

    {
        std::ofstream out(path);
        out << "{\"examples\": [ {\"board\": [[1,2],[3]], \"stores\": [0,0]} ]}";
    }
    st = load_json(path, loaded);
    assert(!st.ok && "Ragged board rejected");

    {
        std::ofstream out(path);
        out << "{\"examples\": [ {\"board\": [[4294967297],[0]], \"stores\": [0,0], \"utilities\": []} ]}";
    }
    st = load_json(path, loaded);
    assert(!st.ok && st.error.find("example 0") != std::string::npos && "Count past the int range rejected");

    {
        std::ofstream out(path);
        out << "{\"examples\": [ {\"board\": [[1],[0]], \"stores\": [2147483647,0], \"utilities\": []} ]}";
    }
    st = load_json(path, loaded);
    assert(!st.ok && "Stone total past INT_MAX rejected");

    {
        std::ofstream out(path);
        out << "{\"examples\": [ {\"board\": [[1],[0]], \"stores\": [0,0], "
               "\"utilities\": [{\"move\": 4294967297, \"utility\": 1}]} ]}";
    }
    st = load_json(path, loaded);
    assert(!st.ok && "Move code past the int range rejected");

    {
        std::ofstream out(path);
        out << "not json";
    }
    st = load_json(path, loaded);
    assert(!st.ok && "Parse errors are reported, not thrown");
    std::remove(path.c_str());
}

static void test_generate_dataset() {
    DatagenConfig cfg;
    cfg.runs = 4;
    cfg.max_moves = 5;
    cfg.pits = 4;
    cfg.stones = 3;
    cfg.depth = 3;
    cfg.threads = 2;
    cfg.seed = 11;

    Dataset first = generate_dataset(cfg);
    assert(!first.empty() && first.size() <= 20 && "At most one example per run and opening length");
    assert(first.pits() == 4 && "Examples use the configured board");
    for (const Example& e : first.data()) {
        assert(!is_over(e.state()) && "Terminal positions are skipped");
        assert(e.utilities().size() == 5 && "Utilities for codes 0..4");
        const std::vector<Move> legal = valid_moves(e.state());
        for (int code = 0; code <= 4; code++) {
            Move m = move_from_code(code);
            bool is_legal = std::find(legal.begin(), legal.end(), m) != legal.end();
            assert(std::isfinite(e.utility(m)) == is_legal && "Legal moves scored, others -inf");
        }
    }

    cfg.threads = 1;
    Dataset second = generate_dataset(cfg);
    assert(second.size() == first.size() && "Thread count does not change the output");
    for (size_t i = 0; i < first.size(); i++) {
        assert(first.data()[i] == second.data()[i] && "Output is ordered by run");
    }

    cfg.deduplicate = true;
    Dataset unique = generate_dataset(cfg);
    assert(unique.size() <= first.size() && "Dedup never adds examples");

    cfg.pits = 9;
    assert(!validate(cfg).empty() && generate_dataset(cfg).empty() && "Unsupported board size refused");
}

int main() {
    test_example_pads_missing_moves();
    test_record_layout();
    test_record_rejections();
    test_to_records();
    test_deduplicate();
    test_csv_round_trip();
    test_csv_unparsable_cells_and_bad_rows();
    test_json_round_trip();
    test_generate_dataset();
    std::cout << "All dataset tests passed\n";
    return 0;
}
