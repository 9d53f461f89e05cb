#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace rebalsim {
namespace analytics {

// Rolling per-symbol close history owned by one simulation run.
// Append-only; the oldest point is evicted once max_length is exceeded.
class PriceHistoryStore {
public:
    static constexpr size_t kDefaultMaxLength = 30;

    explicit PriceHistoryStore(size_t max_length = kDefaultMaxLength);

    // Rejects negative and non-finite prices
    bool append(const std::string& symbol, double price);
    size_t appendSeries(const std::string& symbol, const std::vector<double>& prices);

    // Empty vector for unknown symbols
    const std::vector<double>& prices(const std::string& symbol) const;
    bool contains(const std::string& symbol) const;
    size_t length(const std::string& symbol) const;
    size_t symbolCount() const { return history_.size(); }
    std::vector<std::string> symbols() const;
    const std::map<std::string, std::vector<double>>& snapshot() const { return history_; }

    // p[-1]/p[-2]-1, 0 when fewer than two points
    double lastReturn(const std::string& symbol) const;

    size_t maxLength() const { return max_length_; }
    void clear() { history_.clear(); }

private:
    size_t max_length_;
    std::map<std::string, std::vector<double>> history_;
};

} // namespace analytics
} // namespace rebalsim
