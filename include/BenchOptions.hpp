#pragma once

#include "Config.hpp"
#include <chrono>
#include <string>

namespace sqlpool {

struct BenchOptions {
    Config config;

    // churn, spin-park, timeout-scaling, custom, all
    std::string scenario = "all";

    // Used by the custom scenario
    int threads = 20;
    int opsPerThread = 50;
    int64_t holdMicros = 1000;

    // timeout-scaling per-acquire timeout
    int64_t waiterTimeoutMs = 50;

    bool json = false;
    bool debug = false;

    // Parse command line arguments, layering them over -c <file> if given
    static BenchOptions parseArgs(int argc, char* argv[]);
};

}  // namespace sqlpool
