#pragma once

#include "PoolMetrics.hpp"
#include "Config.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqlpool {

using json = nlohmann::json;

struct ReportOptions {
    bool pretty = true;
    int indent = 2;
    double capacityWarningRatio = 0.9;  // peak usage / max_size that triggers advice
};

// Renders pool metrics snapshots for humans and for tooling
class MetricsReport {
public:
    // Snapshot as a JSON object with snake_case keys
    static json toJSON(const PoolMetrics::Snapshot& snapshot);
    static std::string toJSONString(const PoolMetrics::Snapshot& snapshot,
                                    const ReportOptions& options = ReportOptions{});

    // Aligned "name: value" lines
    static std::string toText(const PoolMetrics::Snapshot& snapshot);

    // Sizing hints derived from a snapshot; empty when nothing stands out
    static std::vector<std::string> advise(const PoolMetrics::Snapshot& snapshot,
                                           const PoolConfig& config,
                                           const ReportOptions& options = ReportOptions{});
};

}  // namespace sqlpool
