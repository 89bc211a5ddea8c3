#include "MetricsReport.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace sqlpool {

json MetricsReport::toJSON(const PoolMetrics::Snapshot& s) {
    json obj = json::object();
    obj["total_acquires"] = s.totalAcquires;
    obj["total_releases"] = s.totalReleases;
    obj["total_waits"] = s.totalWaits;
    obj["spin_waits"] = s.spinWaits;
    obj["park_waits"] = s.parkWaits;
    obj["total_timeouts"] = s.totalTimeouts;
    obj["avg_wait_time_ms"] = s.avgWaitTimeMs;
    obj["wait_percentage"] = s.waitPercentage;
    obj["health_check_failures"] = s.healthCheckFailures;
    obj["reconnections"] = s.reconnections;
    obj["connections_created"] = s.connectionsCreated;
    obj["connections_destroyed"] = s.connectionsDestroyed;
    obj["connect_failures"] = s.connectFailures;
    obj["close_failures"] = s.closeFailures;
    obj["release_warnings"] = s.releaseWarnings;
    obj["peak_usage"] = s.peakUsage;
    obj["current_usage"] = s.currentUsage;
    obj["pool_size"] = s.poolSize;
    return obj;
}

std::string MetricsReport::toJSONString(const PoolMetrics::Snapshot& snapshot,
                                        const ReportOptions& options) {
    return toJSON(snapshot).dump(options.pretty ? options.indent : -1);
}

std::string MetricsReport::toText(const PoolMetrics::Snapshot& s) {
    const std::pair<const char*, std::string> rows[] = {
        {"Total acquires", std::to_string(s.totalAcquires)},
        {"Total releases", std::to_string(s.totalReleases)},
        {"Total waits", std::to_string(s.totalWaits)},
        {"  spin", std::to_string(s.spinWaits)},
        {"  park", std::to_string(s.parkWaits)},
        {"Timeouts", std::to_string(s.totalTimeouts)},
        {"Health check failures", std::to_string(s.healthCheckFailures)},
        {"Reconnections", std::to_string(s.reconnections)},
        {"Connect failures", std::to_string(s.connectFailures)},
        {"Release warnings", std::to_string(s.releaseWarnings)},
        {"Peak usage", std::to_string(s.peakUsage)},
        {"Current usage", std::to_string(s.currentUsage)},
        {"Pool size", std::to_string(s.poolSize)},
    };

    std::ostringstream out;
    for (const auto& [name, value] : rows) {
        out << std::left << std::setw(24) << name << value << "\n";
    }
    out << std::fixed << std::setprecision(2);
    out << std::left << std::setw(24) << "Wait percentage" << s.waitPercentage << "%\n";
    out << std::left << std::setw(24) << "Avg wait time" << s.avgWaitTimeMs << " ms\n";
    return out.str();
}

std::vector<std::string> MetricsReport::advise(const PoolMetrics::Snapshot& s,
                                               const PoolConfig& config,
                                               const ReportOptions& options) {
    std::vector<std::string> advice;

    double maxSize = static_cast<double>(config.max_size);
    if (s.totalAcquires > 0 && static_cast<double>(s.peakUsage) >= maxSize * options.capacityWarningRatio) {
        advice.push_back("Pool frequently at capacity - consider increasing max_size (peak " +
                         std::to_string(s.peakUsage) + "/" + std::to_string(config.max_size) + ")");
    }
    if (s.totalTimeouts > 0) {
        advice.push_back(std::to_string(s.totalTimeouts) +
                         " acquire calls timed out - raise acquire_timeout or max_size");
    }
    if (s.totalWaits > 0 && s.parkWaits * 2 > s.totalWaits && config.spin_iterations == 0) {
        advice.push_back("Most waits parked with spinning disabled - try spin_iterations > 0");
    }
    if (s.connectFailures > 0) {
        advice.push_back(std::to_string(s.connectFailures) +
                         " connection attempts failed - check backend availability");
    }
    return advice;
}

}  // namespace sqlpool
