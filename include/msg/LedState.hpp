#pragma once
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace msg {

// led name -> 0 (off) / 1 (on). Compared by value; LEDs absent from a
// target are "don't care".
using LedState = std::map<std::string, uint8_t>;

struct PatternStep {
    LedState target;
    double min_s = 0.0;
    double max_s = std::numeric_limits<double>::infinity();  // unbounded
};

using Pattern = std::vector<PatternStep>;

} // namespace msg
