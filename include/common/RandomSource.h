#pragma once

#include <cstdint>
#include <random>

namespace rebalsim {

// Randomness is only used by the synthetic-return fallback and the
// execution-metadata model. Inject a seeded source per run.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    virtual double normal(double mean, double stddev) = 0;
    virtual double uniform(double low, double high) = 0;
};

class MersenneRandomSource : public IRandomSource {
public:
    explicit MersenneRandomSource(std::uint64_t seed) : engine_(seed) {}

    double normal(double mean, double stddev) override {
        if (stddev <= 0.0) {
            return mean;
        }
        std::normal_distribution<double> dist(mean, stddev);
        return dist(engine_);
    }

    double uniform(double low, double high) override {
        if (high <= low) {
            return low;
        }
        std::uniform_real_distribution<double> dist(low, high);
        return dist(engine_);
    }

private:
    std::mt19937_64 engine_;
};

} // namespace rebalsim
