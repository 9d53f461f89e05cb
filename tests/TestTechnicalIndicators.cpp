#include "analytics/TechnicalIndicators.h"
#include "analytics/PriceHistoryStore.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

using rebalsim::analytics::PriceHistoryStore;
using rebalsim::analytics::TechnicalIndicators;

namespace {
bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}
}

int main() {
    {
        const std::vector<double> values{1, 2, 3, 4, 5};
        assert(TechnicalIndicators::tail(values, 3) == (std::vector<double>{3, 4, 5}));
        assert(TechnicalIndicators::tail(values, 10).size() == 5);
    }

    {
        const auto returns = TechnicalIndicators::dailyReturns({100.0, 110.0, 99.0});
        assert(returns.size() == 2);
        assert(near(returns[0], 0.10));
        assert(near(returns[1], -0.10));
        assert(TechnicalIndicators::dailyReturns({100.0}).empty());
    }

    {
        assert(near(TechnicalIndicators::calculateMean({}), 0.0));
        assert(near(TechnicalIndicators::calculateMean({1.0, 2.0, 3.0}), 2.0));
        // population deviation
        assert(near(TechnicalIndicators::calculateStandardDeviation({1.0, 3.0}, 2.0), 1.0));
        assert(near(TechnicalIndicators::calculateSMA({1, 2, 3, 4}, 2), 3.5));
        assert(near(TechnicalIndicators::calculateSMA({1, 2}, 5), 0.0));
    }

    {
        // constant growth has zero return dispersion
        const std::vector<double> prices{100.0, 101.0, 102.01, 103.0301};
        assert(TechnicalIndicators::calculateVolatility(prices) < 1e-12);
        assert(near(TechnicalIndicators::calculateTrend({100.0, 105.0, 110.0}), 0.10 / 3.0));
        assert(near(TechnicalIndicators::calculateTrend({0.0, 1.0}), 0.0));
    }

    {
        const auto fit = TechnicalIndicators::linearRegression({1.0, 3.0, 5.0, 7.0});
        assert(fit.valid);
        assert(near(fit.slope, 2.0));
        assert(near(fit.r_squared, 1.0));

        const auto flat = TechnicalIndicators::linearRegression({5.0, 5.0, 5.0});
        assert(!flat.valid);
    }

    {
        const std::vector<double> a{100, 102, 101, 104, 103};
        const std::vector<double> b{50, 51, 50.5, 52, 51.5};
        assert(near(TechnicalIndicators::calculateCorrelation(a, b), 1.0, 1e-6));
        assert(near(TechnicalIndicators::calculateCorrelation(a, {1, 2, 3}), 0.0));
    }

    {
        assert(near(TechnicalIndicators::directionalConsistency({1, 2, 3, 4, 5}), 1.0));
        assert(near(TechnicalIndicators::directionalConsistency({1, 2, 1, 2, 1}), 0.0));
    }

    {
        PriceHistoryStore store(3);
        assert(store.append("BTC", 100.0));
        assert(!store.append("BTC", -1.0));
        assert(!store.append("BTC", std::numeric_limits<double>::quiet_NaN()));
        assert(store.appendSeries("BTC", {101.0, 102.0, 103.0}) == 3);
        assert(store.length("BTC") == 3);
        assert(store.prices("BTC").front() == 101.0);
        assert(near(store.lastReturn("BTC"), 103.0 / 102.0 - 1.0));
        assert(store.prices("ETH").empty());
        assert(store.lastReturn("ETH") == 0.0);
        assert(!store.contains("ETH"));
        assert(store.symbolCount() == 1);
        assert(store.snapshot().at("BTC") == store.prices("BTC"));

        store.clear();
        assert(store.symbols().empty());
    }

    std::cout << "[TEST] TechnicalIndicators PASSED\n";
    return 0;
}
