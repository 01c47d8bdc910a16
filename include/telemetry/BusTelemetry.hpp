#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "telemetry/TelemetrySnapshot.hpp"

namespace Preflight::Core {

struct BusTelemetry {
    // Notice counters
    std::atomic<uint64_t> total_notices{0};
    std::atomic<uint64_t> step_notices{0};
    std::atomic<uint64_t> warning_notices{0};
    std::atomic<uint64_t> error_notices{0};

    // Time window
    std::chrono::steady_clock::time_point window_start;

    BusTelemetry();
    [[nodiscard]] TelemetrySnapshot snapshot() const;
};

} // namespace Preflight::Core
