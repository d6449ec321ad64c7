// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#include "telemetry/PipelineTelemetry.hpp"

namespace Adaptive::Core {

PipelineTelemetry::PipelineTelemetry()
    : window_start(std::chrono::steady_clock::now().time_since_epoch().count())
{
}

void PipelineTelemetry::task_started() {
    uint32_t current = ++in_flight;
    uint32_t peak = peak_in_flight.load();
    while (current > peak && !peak_in_flight.compare_exchange_weak(peak, current)) {
    }
}

void PipelineTelemetry::task_finished() {
    in_flight--;
}

void PipelineTelemetry::record_prediction(bool present) {
    predictions_published++;
    if (!present) {
        absent_predictions++;
    }
}

void PipelineTelemetry::reset_window() {
    peak_in_flight.store(in_flight.load());
    window_start.store(std::chrono::steady_clock::now().time_since_epoch().count());
}

TelemetrySnapshot PipelineTelemetry::snapshot() const {
    TelemetrySnapshot snap{};

    snap.received = received_events.load();
    snap.ignored  = ignored_events.load();
    snap.stored   = stored_events.load();
    snap.trained  = trained_events.load();
    snap.failed   = failed_events.load();

    snap.predictions_published = predictions_published.load();
    snap.absent_predictions    = absent_predictions.load();
    snap.prediction_failures   = prediction_failures.load();

    snap.in_flight_current = in_flight.load();
    snap.in_flight_peak    = peak_in_flight.load();

    snap.state = state.load();
    snap.observation_failures = observation_failures.load();
    snap.observation_restarts = observation_restarts.load();

    snap.window_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()
            - std::chrono::steady_clock::duration(window_start.load())
        ).count();

    return snap;
}

} // namespace Adaptive::Core
