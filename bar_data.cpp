#include "bar_data.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace stock_dbn {

namespace {

void trim(std::string& field) {
    size_t first = field.find_first_not_of(" \t");
    size_t last = field.find_last_not_of(" \t");
    field = first == std::string::npos ? std::string() : field.substr(first, last - first + 1);
}

// Both fields must be consumed whole; "2024-01-02" is not timestamp 2024.
bool parse_bar(const std::string& ts, const std::string& close, Bar& bar) {
    try {
        size_t used = 0;
        bar.timestamp = std::stoll(ts, &used);
        if (used != ts.size()) return false;
        bar.close = std::stod(close, &used);
        return used == close.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

}  // namespace

std::vector<Bar> read_bars(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open bar file " + path);
    }
    return parse_bars(in);
}

std::vector<Bar> parse_bars(std::istream& in) {
    std::vector<Bar> bars;
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        std::stringstream fields(line);
        std::string ts, close;
        if (!std::getline(fields, ts, ',') || !std::getline(fields, close, ',')) {
            spdlog::warn("bar line {}: expected 'timestamp,close', skipped", line_number);
            continue;
        }
        trim(ts);
        trim(close);
        Bar bar;
        if (parse_bar(ts, close, bar)) {
            bars.push_back(bar);
        } else if (line_number > 1 || ts.find_first_of("0123456789") != std::string::npos) {
            spdlog::warn("bar line {}: cannot parse '{}', skipped", line_number, line);
        }
    }
    return bars;
}

std::vector<Observation> label_directions(const std::vector<Bar>& bars, const std::string& node_id) {
    std::vector<Observation> observations;
    for (size_t i = 1; i < bars.size(); ++i) {
        Observation obs;
        obs.timestamp = bars[i].timestamp;
        obs.values[node_id] = bars[i].close > bars[i - 1].close ? "up" : "down";
        observations.push_back(std::move(obs));
    }
    return observations;
}

}  // namespace stock_dbn
