#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace rebalsim {
namespace core {

// Source of real OHLCV rows. Implementations may return fewer rows than
// requested (or none); callers fall back to synthetic returns.
class IPriceHistoryProvider {
public:
    virtual ~IPriceHistoryProvider() = default;

    // Up to `lookback` rows with timestamp <= end_timestamp_ms, oldest first
    virtual std::vector<Candle> getHistory(const std::string& symbol,
                                           const std::string& interval,
                                           int lookback,
                                           long long end_timestamp_ms) = 0;
};

} // namespace core
} // namespace rebalsim
