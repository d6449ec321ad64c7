#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "telemetry/TelemetryTypes.hpp"
#include "telemetry/TelemetrySnapshot.hpp"

namespace Adaptive::Core {

struct PipelineTelemetry {
    // Event counters
    std::atomic<uint64_t> received_events{0};
    std::atomic<uint64_t> ignored_events{0};
    std::atomic<uint64_t> stored_events{0};
    std::atomic<uint64_t> trained_events{0};
    std::atomic<uint64_t> failed_events{0};

    // Prediction counters
    std::atomic<uint64_t> predictions_published{0};
    std::atomic<uint64_t> absent_predictions{0};
    std::atomic<uint64_t> prediction_failures{0};

    // In-flight metrics
    std::atomic<uint32_t> in_flight{0};
    std::atomic<uint32_t> peak_in_flight{0};

    // Pipeline state
    std::atomic<PipelineState> state{PipelineState::IDLE};
    std::atomic<uint64_t> observation_failures{0};
    std::atomic<uint64_t> observation_restarts{0};

    // Time window (steady_clock ticks; reset a control szálról, olvasás bárhonnan)
    std::atomic<std::chrono::steady_clock::rep> window_start{0};

    void task_started();
    void task_finished();
    void record_prediction(bool present);

    PipelineTelemetry();
    [[nodiscard]] TelemetrySnapshot snapshot() const;
    void reset_window();
};

}
