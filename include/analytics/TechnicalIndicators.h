#pragma once

#include <vector>
#include <cstddef>

namespace rebalsim {
namespace analytics {

// Price-series statistics shared by the selector, the regime detector and the
// hybrid engine. All functions are pure and tolerate short input.
class TechnicalIndicators {
public:
    // Last n elements (whole series when shorter)
    static std::vector<double> tail(const std::vector<double>& values, size_t n);

    // Simple returns p[i]/p[i-1]-1; zero-priced steps are skipped
    static std::vector<double> dailyReturns(const std::vector<double>& prices);

    static double calculateMean(const std::vector<double>& values);

    // Population standard deviation around the given mean
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);

    // Population stdev of daily returns; 0 for fewer than 2 prices
    static double calculateVolatility(const std::vector<double>& prices);

    // SMA over the last `period` prices; 0 when not enough data
    static double calculateSMA(const std::vector<double>& prices, int period);

    // (last/first - 1) / length
    static double calculateTrend(const std::vector<double>& prices);

    struct RegressionResult {
        double slope;
        double r_squared;
        bool valid;        // false when x or y has no variance

        RegressionResult() : slope(0), r_squared(0), valid(false) {}
    };
    // Least squares fit of price against index
    static RegressionResult linearRegression(const std::vector<double>& prices);

    // Pearson correlation of the two return series; 0 when degenerate or lengths differ
    static double calculateCorrelation(const std::vector<double>& prices1,
                                       const std::vector<double>& prices2);

    // |up_moves/moves - 0.5| * 2, in [0,1]
    static double directionalConsistency(const std::vector<double>& prices);
};

} // namespace analytics
} // namespace rebalsim
