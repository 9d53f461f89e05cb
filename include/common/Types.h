#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>

namespace rebalsim {

using Timestamp = std::chrono::system_clock::time_point;

// symbol -> weight in [0,1]
using Allocation = std::map<std::string, double>;

// One OHLCV row as returned by the price-history collaborator (timestamp in ms)
struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

inline double allocationTotal(const Allocation& allocation) {
    double total = 0.0;
    for (const auto& [symbol, weight] : allocation) {
        total += weight;
    }
    return total;
}

} // namespace rebalsim
