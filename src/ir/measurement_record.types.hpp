#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace qviz {

struct MeasurementRecord {
    std::vector<int> targets;
    std::vector<int> bits;
};

// Bitstring (qubit n-1 leftmost) -> number of occurrences.
using MeasurementHistogram = std::map<std::string, int>;

struct ExecutionLog {
    std::size_t step = 0;
    std::string category;
    std::string message;
};

}  // namespace qviz
