#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace rebalsim {
namespace analytics {

std::vector<double> TechnicalIndicators::tail(const std::vector<double>& values, size_t n) {
    if (values.size() <= n) {
        return values;
    }
    return std::vector<double>(values.end() - static_cast<std::ptrdiff_t>(n), values.end());
}

std::vector<double> TechnicalIndicators::dailyReturns(const std::vector<double>& prices) {
    std::vector<double> returns;
    if (prices.size() < 2) {
        return returns;
    }
    returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i - 1] <= 0.0) {
            continue;
        }
        returns.push_back(prices[i] / prices[i - 1] - 1.0);
    }
    return returns;
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double TechnicalIndicators::calculateStandardDeviation(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq = 0.0;
    for (double v : values) {
        const double diff = v - mean;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

double TechnicalIndicators::calculateVolatility(const std::vector<double>& prices) {
    const auto returns = dailyReturns(prices);
    if (returns.empty()) {
        return 0.0;
    }
    const double mean = calculateMean(returns);
    double variance = 0.0;
    for (double r : returns) {
        variance += (r - mean) * (r - mean);
    }
    variance /= static_cast<double>(returns.size());
    return std::sqrt(variance);
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) {
        return 0.0;
    }
    const double sum = std::accumulate(prices.end() - period, prices.end(), 0.0);
    return sum / period;
}

double TechnicalIndicators::calculateTrend(const std::vector<double>& prices) {
    if (prices.size() < 2 || prices.front() <= 0.0) {
        return 0.0;
    }
    return (prices.back() / prices.front() - 1.0) / static_cast<double>(prices.size());
}

TechnicalIndicators::RegressionResult TechnicalIndicators::linearRegression(const std::vector<double>& prices) {
    RegressionResult result;
    const size_t n = prices.size();
    if (n < 2) {
        return result;
    }

    const double x_mean = static_cast<double>(n - 1) / 2.0;
    const double y_mean = calculateMean(prices);

    double numerator = 0.0;
    double denominator = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - x_mean;
        numerator += dx * (prices[i] - y_mean);
        denominator += dx * dx;
    }
    if (denominator == 0.0) {
        return result;
    }
    result.slope = numerator / denominator;

    double ss_res = 0.0;
    double ss_tot = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double predicted = y_mean + result.slope * (static_cast<double>(i) - x_mean);
        ss_res += (prices[i] - predicted) * (prices[i] - predicted);
        ss_tot += (prices[i] - y_mean) * (prices[i] - y_mean);
    }
    if (ss_tot == 0.0) {
        return result;
    }

    result.r_squared = std::clamp(1.0 - ss_res / ss_tot, 0.0, 1.0);
    result.valid = true;
    return result;
}

double TechnicalIndicators::calculateCorrelation(const std::vector<double>& prices1,
                                                 const std::vector<double>& prices2) {
    if (prices1.size() != prices2.size() || prices1.size() < 2) {
        return 0.0;
    }
    const auto returns1 = dailyReturns(prices1);
    const auto returns2 = dailyReturns(prices2);
    if (returns1.size() != returns2.size() || returns1.size() < 2) {
        return 0.0;
    }

    const double mean1 = calculateMean(returns1);
    const double mean2 = calculateMean(returns2);

    double numerator = 0.0;
    double sum_sq1 = 0.0;
    double sum_sq2 = 0.0;
    for (size_t i = 0; i < returns1.size(); ++i) {
        numerator += (returns1[i] - mean1) * (returns2[i] - mean2);
        sum_sq1 += (returns1[i] - mean1) * (returns1[i] - mean1);
        sum_sq2 += (returns2[i] - mean2) * (returns2[i] - mean2);
    }

    const double denominator = std::sqrt(sum_sq1) * std::sqrt(sum_sq2);
    if (denominator == 0.0) {
        return 0.0;
    }
    return numerator / denominator;
}

double TechnicalIndicators::directionalConsistency(const std::vector<double>& prices) {
    if (prices.size() < 3) {
        return 0.0;
    }
    const size_t moves = prices.size() - 1;
    size_t up_moves = 0;
    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i] > prices[i - 1]) {
            ++up_moves;
        }
    }
    const double up_ratio = static_cast<double>(up_moves) / static_cast<double>(moves);
    return std::abs(up_ratio - 0.5) * 2.0;
}

} // namespace analytics
} // namespace rebalsim
