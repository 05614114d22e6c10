#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "belief_state.h"

namespace stock_dbn {

struct Bar {
    long long timestamp;
    double close;
};

// timestamp,close rows. A first line without digits is a header; rows whose
// fields do not parse completely are skipped with a warning.
std::vector<Bar> read_bars(const std::string& path);
std::vector<Bar> parse_bars(std::istream& in);

// One observation per consecutive pair of bars, stamped with the later bar:
// "up" when the close rises, "down" otherwise.
std::vector<Observation> label_directions(const std::vector<Bar>& bars,
                                          const std::string& node_id = "Direction");

}  // namespace stock_dbn
