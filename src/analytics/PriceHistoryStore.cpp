#include "analytics/PriceHistoryStore.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace rebalsim {
namespace analytics {

namespace {
const std::vector<double> kEmptySeries;
}

PriceHistoryStore::PriceHistoryStore(size_t max_length)
    : max_length_(std::max<size_t>(1, max_length)) {}

bool PriceHistoryStore::append(const std::string& symbol, double price) {
    if (!std::isfinite(price) || price < 0.0) {
        LOG_WARN("Rejected price {} for {}", price, symbol);
        return false;
    }

    auto& series = history_[symbol];
    series.push_back(price);
    if (series.size() > max_length_) {
        series.erase(series.begin(), series.begin() + static_cast<std::ptrdiff_t>(series.size() - max_length_));
    }
    return true;
}

size_t PriceHistoryStore::appendSeries(const std::string& symbol, const std::vector<double>& prices) {
    size_t accepted = 0;
    for (double price : prices) {
        if (append(symbol, price)) {
            ++accepted;
        }
    }
    return accepted;
}

const std::vector<double>& PriceHistoryStore::prices(const std::string& symbol) const {
    auto it = history_.find(symbol);
    if (it == history_.end()) {
        return kEmptySeries;
    }
    return it->second;
}

bool PriceHistoryStore::contains(const std::string& symbol) const {
    return history_.find(symbol) != history_.end();
}

size_t PriceHistoryStore::length(const std::string& symbol) const {
    return prices(symbol).size();
}

std::vector<std::string> PriceHistoryStore::symbols() const {
    std::vector<std::string> out;
    out.reserve(history_.size());
    for (const auto& [symbol, series] : history_) {
        out.push_back(symbol);
    }
    return out;
}

double PriceHistoryStore::lastReturn(const std::string& symbol) const {
    const auto& series = prices(symbol);
    if (series.size() < 2) {
        return 0.0;
    }
    const double prev = series[series.size() - 2];
    if (prev <= 0.0) {
        return 0.0;
    }
    return series.back() / prev - 1.0;
}

} // namespace analytics
} // namespace rebalsim
