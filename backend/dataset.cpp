#include "dataset.hpp"

#include "json_codec.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <unordered_set>

using json = nlohmann::json;

namespace kalah {
namespace {

constexpr float kNegInf = -std::numeric_limits<float>::infinity();

static uint32_t float_bits(float f) {
    uint32_t bits = 0;
    std::memcpy(&bits, &f, sizeof(bits));
    return bits;
}

// Whole numbers in [0, INT_MAX]; 2^31 is the first float past the int range.
static bool is_count(float v) {
    return std::isfinite(v) && v >= 0.0f && v < 2147483648.0f && v == std::floor(v);
}

static IoStatus io_ok() {
    IoStatus st;
    st.ok = true;
    return st;
}

static IoStatus io_error(const std::string& msg) {
    IoStatus st;
    st.ok = false;
    st.error = msg;
    return st;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Nine significant digits are enough for any float to read back identically.
static std::string format_cell(float v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v < 0 ? "-inf" : "inf";
    std::ostringstream os;
    os << std::setprecision(9) << v;
    return os.str();
}

static float parse_cell(const std::string& raw) {
    std::string s = raw;
    while (!s.empty() && (s.back() == '\r' || s.back() == ' ')) s.pop_back();
    size_t first = s.find_first_not_of(' ');
    if (first == std::string::npos) return std::numeric_limits<float>::quiet_NaN();
    s = s.substr(first);

    char* end = nullptr;
    float v = std::strtof(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') return std::numeric_limits<float>::quiet_NaN();
    return v;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    std::istringstream in(line);
    while (std::getline(in, cell, ',')) cells.push_back(cell);
    if (!line.empty() && line.back() == ',') cells.push_back(std::string());
    return cells;
}

} // namespace

Example::Example(DynGameState state, const std::vector<MoveUtility>& utilities)
    : state_(std::move(state)), utilities_(state_.pits() + 1, kNegInf) {
    for (const auto& mu : utilities) {
        int code = move_code(mu.move);
        if (code >= 0 && code < (int)utilities_.size()) utilities_[code] = mu.utility;
    }
}

float Example::utility(const Move& m) const {
    int code = move_code(m);
    if (code < 0 || code >= (int)utilities_.size()) return kNegInf;
    return utilities_[code];
}

std::vector<float> Example::to_record() const {
    std::vector<float> out;
    out.reserve(record_length(state_.pits()));
    out.push_back((float)state_.stores()[0]);
    out.push_back((float)state_.stores()[1]);
    for (const auto& row : state_.board()) {
        for (int pit : row) out.push_back((float)pit);
    }
    out.push_back((float)number(state_.current_turn()));
    out.push_back((float)state_.ply());
    out.push_back(state_.player2_moved() ? 1.0f : 0.0f);
    out.insert(out.end(), utilities_.begin(), utilities_.end());
    return out;
}

bool Example::operator==(const Example& o) const {
    if (state_ != o.state_ || utilities_.size() != o.utilities_.size()) return false;
    for (size_t i = 0; i < utilities_.size(); i++) {
        if (float_bits(utilities_[i]) != float_bits(o.utilities_[i])) return false;
    }
    return true;
}

std::size_t record_length(std::size_t pits) {
    return 3 * pits + 6;
}

bool example_from_record(const std::vector<float>& record, Example& out, std::string* reason) {
    auto fail = [&](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };

    if (record.size() < record_length(1) || (record.size() - 6) % 3 != 0) {
        return fail("record length " + std::to_string(record.size()) + " is not 3 * pits + 6");
    }
    const size_t n = (record.size() - 6) / 3;

    for (size_t i = 0; i < 2 + 2 * n; i++) {
        if (!is_count(record[i])) return fail("field " + std::to_string(i) + " is not a stone count");
    }
    const float turn = record[2 + 2 * n];
    const float ply = record[3 + 2 * n];
    const float moved = record[4 + 2 * n];
    if (turn != 1.0f && turn != 2.0f) return fail("turn must be 1 or 2");
    if (!is_count(ply)) return fail("ply must be a non-negative integer");
    if (moved != 0.0f && moved != 1.0f) return fail("player 2 moved flag must be 0 or 1");

    std::vector<int> row1;
    std::vector<int> row2;
    for (size_t i = 0; i < n; i++) {
        row1.push_back((int)record[2 + i]);
        row2.push_back((int)record[2 + n + i]);
    }
    std::optional<DynGameState> s = make_dyn_state(std::move(row1), std::move(row2), (int)record[0],
                                                   (int)record[1], turn == 1.0f ? Player::One : Player::Two,
                                                   (int)ply, moved == 1.0f);
    if (!s) return fail("stone total or ply does not fit in an int");

    std::vector<MoveUtility> utils;
    for (size_t code = 0; code <= n; code++) {
        utils.push_back(MoveUtility{move_from_code((int)code), record[5 + 2 * n + code]});
    }
    out = Example(std::move(*s), utils);
    return true;
}

std::size_t Dataset::pits() const {
    return data_.empty() ? 0 : data_.front().state().pits();
}

Dataset Dataset::deduplicated() const {
    const std::vector<std::vector<float>> records = to_records();
    std::unordered_set<std::string> seen;
    std::vector<Example> unique;
    for (size_t i = 0; i < data_.size(); i++) {
        const std::vector<float>& rec = records[i];
        std::string key(rec.size() * sizeof(float), '\0');
        std::memcpy(&key[0], rec.data(), key.size());
        if (seen.insert(std::move(key)).second) unique.push_back(data_[i]);
    }
    return Dataset(std::move(unique));
}

std::vector<std::vector<float>> Dataset::to_records() const {
    std::vector<std::vector<float>> out;
    out.reserve(data_.size());
    for (const auto& e : data_) out.push_back(e.to_record());
    return out;
}

std::string csv_header(std::size_t pits) {
    std::ostringstream os;
    os << "store1,store2";
    for (int player = 1; player <= 2; player++) {
        for (size_t p = 1; p <= pits; p++) os << ",player" << player << "p" << p;
    }
    os << ",turn,ply,p2_moved,util_swap";
    for (size_t p = 1; p <= pits; p++) os << ",util_" << p;
    return os.str();
}

IoStatus Dataset::save_csv(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) return io_error("cannot open " + path + " for writing");

    const size_t n = pits();
    out << csv_header(n) << "\n";
    for (const auto& e : data_) {
        if (e.state().pits() != n) return io_error("dataset mixes board sizes");
        std::vector<float> rec = e.to_record();
        for (size_t i = 0; i < rec.size(); i++) {
            if (i) out << ",";
            out << format_cell(rec[i]);
        }
        out << "\n";
    }
    out.flush();
    if (!out) return io_error("write to " + path + " failed");
    return io_ok();
}

IoStatus load_csv(const std::string& path, Dataset& out) {
    std::ifstream in(path);
    if (!in) return io_error("cannot open " + path);

    std::string line;
    if (!std::getline(in, line)) return io_error(path + ": missing header");
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const size_t columns = split_csv_line(line).size();
    if (columns < record_length(1) || (columns - 6) % 3 != 0) {
        return io_error(path + ": header has " + std::to_string(columns) + " columns, expected 3 * pits + 6");
    }

    Dataset tmp;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::vector<std::string> cells = split_csv_line(line);
        if (cells.size() != columns) {
            return io_error(path + ":" + std::to_string(line_no) + ": expected " + std::to_string(columns) +
                            " fields, got " + std::to_string(cells.size()));
        }
        std::vector<float> rec;
        rec.reserve(cells.size());
        for (const auto& c : cells) rec.push_back(parse_cell(c));

        Example e;
        std::string why;
        if (!example_from_record(rec, e, &why)) {
            return io_error(path + ":" + std::to_string(line_no) + ": " + why);
        }
        tmp.push_back(std::move(e));
    }

    out = std::move(tmp);
    return io_ok();
}

IoStatus Dataset::save_json(const std::string& path) const {
    json examples = json::array();
    for (const auto& e : data_) {
        json utils = json::array();
        const auto& u = e.utilities();
        for (size_t code = 0; code < u.size(); code++) {
            utils.push_back(json{{"move", (int)code}, {"utility", utility_to_json(u[code])}});
        }
        json item = board_state_to_json(e.state());
        item["utilities"] = utils;
        examples.push_back(std::move(item));
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) return io_error("cannot open " + path + " for writing");
    out << json{{"pits", pits()}, {"examples", examples}}.dump(2) << "\n";
    out.flush();
    if (!out) return io_error("write to " + path + " failed");
    return io_ok();
}

IoStatus load_json(const std::string& path, Dataset& out) {
    std::ifstream in(path);
    if (!in) return io_error("cannot open " + path);
    std::stringstream buf;
    buf << in.rdbuf();

    json root = json::parse(buf.str(), nullptr, false);
    if (root.is_discarded()) return io_error(path + ": invalid JSON");
    if (!root.is_object() || !root.contains("examples") || !root.at("examples").is_array()) {
        return io_error(path + ": missing \"examples\" array");
    }

    Dataset tmp;
    size_t idx = 0;
    for (const auto& item : root.at("examples")) {
        const std::string where = path + ": example " + std::to_string(idx++);
        DynGameState state;
        std::string why;
        if (!board_state_from_json(item, state, &why)) return io_error(where + ": " + why);
        if (!item.contains("utilities") || !item.at("utilities").is_array()) {
            return io_error(where + ": missing utilities");
        }

        std::vector<MoveUtility> utils;
        for (const auto& uj : item.at("utilities")) {
            int code = 0;
            if (!uj.is_object() || !uj.contains("move") || !int_from_json(uj.at("move"), code)) {
                return io_error(where + ": utility entry needs an integer move code");
            }
            if (code < 0 || code > (int)state.pits()) return io_error(where + ": move code out of range");
            float value = kNegInf;
            if (uj.contains("utility") && !utility_from_json(uj.at("utility"), value)) {
                return io_error(where + ": unreadable utility");
            }
            utils.push_back(MoveUtility{move_from_code(code), value});
        }
        tmp.push_back(Example(std::move(state), utils));
    }

    out = std::move(tmp);
    return io_ok();
}

IoStatus save_dataset(const Dataset& ds, const std::string& path) {
    IoStatus st = ends_with(path, ".json") ? ds.save_json(path) : ds.save_csv(path);
    if (st.ok) std::cerr << "[dataset] wrote " << ds.size() << " examples to " << path << "\n";
    return st;
}

IoStatus load_dataset(const std::string& path, Dataset& out) {
    return ends_with(path, ".json") ? load_json(path, out) : load_csv(path, out);
}

} // namespace kalah
