#include "core/state/CycleJournalJsonl.h"
#include "backtest/SimulationSchema.h"

#include <algorithm>
#include <fstream>

namespace rebalsim {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

CycleJournalJsonl::CycleJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            const auto line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception&) {
            continue;   // malformed line
        }
    }
}

bool CycleJournalJsonl::append(const std::string& run_name, const backtest::SimulationCycleRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["run_name"] = run_name;
    line["record"] = backtest::toJson(record);

    out << line.dump() << "\n";
    if (!out) {
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<backtest::SimulationCycleRecord> CycleJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<backtest::SimulationCycleRecord> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        if (parseSeq(line) < seq_inclusive || !line.contains("record")) {
            continue;
        }
        out.push_back(backtest::cycleRecordFromJson(line["record"]));
    }

    return out;
}

std::uint64_t CycleJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace rebalsim
