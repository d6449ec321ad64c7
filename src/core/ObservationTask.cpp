// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container - ObservationTask

#include "core/ObservationTask.hpp"
#include <iostream>
#include <stdexcept>

namespace Adaptive::Core {

    ObservationTask::ObservationTask(DataSource& source,
                                     rxcpp::schedulers::scheduler scope,
                                     Dispatch dispatch,
                                     FailureHandler onFailure,
                                     LogLevel level)
        : source(source),
          scope(std::move(scope)),
          gate(std::make_shared<Gate>()),
          currentLogLevel(level) {
        gate->dispatch = std::move(dispatch);
        gate->onFailure = std::move(onFailure);
    }

    ObservationTask::~ObservationTask() {
        cancelAndJoin();
    }

    void ObservationTask::start() {
        {
            std::lock_guard<std::mutex> guard(gate->lock);
            if (gate->open) return;
            gate->open = true;
        }

        auto sharedGate = gate;

        try {
            subscription = source.observe(
                [sharedGate](const InteractionEvent& event) {
                    std::lock_guard<std::mutex> guard(sharedGate->lock);
                    if (!sharedGate->open) return;
                    sharedGate->dispatch(event);
                },
                [sharedGate](std::exception_ptr error) {
                    std::string reason = "unknown observation failure";
                    try {
                        if (error) std::rethrow_exception(error);
                    } catch (const std::exception& e) {
                        reason = e.what();
                    } catch (...) {
                        reason = "non-standard exception from DataSource";
                    }

                    std::lock_guard<std::mutex> guard(sharedGate->lock);
                    if (!sharedGate->open) return;
                    sharedGate->open = false;
                    sharedGate->failed = true;
                    sharedGate->onFailure(reason);
                },
                scope);
        } catch (...) {
            std::lock_guard<std::mutex> guard(gate->lock);
            gate->open = false;
            throw;
        }

        if (currentLogLevel == LogLevel::DEBUG) {
            std::cout << "[Observation] DataSource feliratkozás aktív." << std::endl;
        }
    }

    void ObservationTask::cancelAndJoin() {
        bool wasOpen;
        {
            // A kapu megszerzése egyben join: a futó callback ezt a zárat tartja
            std::lock_guard<std::mutex> guard(gate->lock);
            wasOpen = gate->open;
            gate->open = false;
        }

        if (subscription.is_subscribed()) {
            subscription.unsubscribe();
        }

        if (wasOpen && currentLogLevel == LogLevel::DEBUG) {
            std::cout << "[Observation] Leállítva (cancel + join)." << std::endl;
        }
    }

    bool ObservationTask::hasFailed() const {
        std::lock_guard<std::mutex> guard(gate->lock);
        return gate->failed;
    }

} // namespace Adaptive::Core
