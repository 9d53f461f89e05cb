#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "backtest/SimulationTypes.h"

namespace rebalsim {
namespace core {

// Receives every completed cycle of a run, in order
class ISimulationRecorder {
public:
    virtual ~ISimulationRecorder() = default;

    virtual bool append(const std::string& run_name, const backtest::SimulationCycleRecord& record) = 0;
    virtual std::vector<backtest::SimulationCycleRecord> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace rebalsim
