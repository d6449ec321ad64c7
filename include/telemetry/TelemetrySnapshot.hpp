#pragma once

#include <cstdint>
#include "telemetry/TelemetryTypes.hpp"

namespace Adaptive::Core {

struct TelemetrySnapshot {
    // --- Event Metrics ---
    uint64_t received;
    uint64_t ignored;
    uint64_t stored;
    uint64_t trained;
    uint64_t failed;

    // --- Prediction Metrics ---
    uint64_t predictions_published;
    uint64_t absent_predictions;
    uint64_t prediction_failures;

    // --- In-flight per-event tasks ---
    uint32_t in_flight_current;
    uint32_t in_flight_peak;

    // --- Pipeline Health ---
    PipelineState state;
    uint64_t observation_failures;
    uint64_t observation_restarts;
    uint64_t window_ms;
};

}
