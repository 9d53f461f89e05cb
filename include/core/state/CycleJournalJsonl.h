#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/ISimulationRecorder.h"

namespace rebalsim {
namespace core {

// Append-only JSON-lines journal of completed cycles. Each line carries a
// monotonically increasing `seq`, the run name and the cycle record.
class CycleJournalJsonl : public ISimulationRecorder {
public:
    explicit CycleJournalJsonl(std::filesystem::path file_path);

    bool append(const std::string& run_name, const backtest::SimulationCycleRecord& record) override;
    std::vector<backtest::SimulationCycleRecord> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace rebalsim
