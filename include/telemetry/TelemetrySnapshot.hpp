#pragma once

#include <cstdint>

struct TelemetrySnapshot {
    // --- Notice Metrics ---
    uint64_t total;
    uint64_t steps;
    uint64_t warnings;
    uint64_t errors;

    // --- Timing ---
    uint64_t window_ms; // A busz létrehozása óta eltelt idő
};
