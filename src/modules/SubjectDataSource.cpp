// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#include "modules/SubjectDataSource.hpp"
#include "core/ContainerErrors.hpp"
#include <iostream>

namespace Adaptive::Modules {

    SubjectDataSource::SubjectDataSource(Core::LogLevel level) : currentLogLevel(level) {}

    void SubjectDataSource::emit(const Core::InteractionEvent& event) {
        std::lock_guard<std::mutex> lock(emitMutex);
        emitted++;
        if (terminated) return;
        events.get_subscriber().on_next(event);
    }

    void SubjectDataSource::fail(const std::string& reason) {
        std::lock_guard<std::mutex> lock(emitMutex);
        if (currentLogLevel != Core::LogLevel::SILENT) {
            std::cout << "[EventBus] Stream hibával zárul: " << reason << std::endl;
        }
        if (terminated) return;
        terminated = true;
        events.get_subscriber().on_error(std::make_exception_ptr(Core::ObservationError(reason)));
    }

    rxcpp::composite_subscription SubjectDataSource::observe(Core::EventCallback onEvent,
                                                             Core::ObservationErrorCallback onError,
                                                             rxcpp::schedulers::scheduler scope) {
        observeCalls++;
        rxcpp::composite_subscription lifetime;

        std::lock_guard<std::mutex> lock(emitMutex);
        if (terminated) {
            // A lezárt subject minden új observernek azonnal on_error-t adna
            events = rxcpp::subjects::subject<Core::InteractionEvent>();
            terminated = false;
            if (currentLogLevel != Core::LogLevel::SILENT) {
                std::cout << "[EventBus] Új stream nyílik a hiba után." << std::endl;
            }
        }

        events.get_observable()
            .observe_on(rxcpp::observe_on_one_worker(scope))
            .subscribe(
                lifetime,
                [onEvent](const Core::InteractionEvent& event) { onEvent(event); },
                [onError](std::exception_ptr error) { onError(error); });

        if (currentLogLevel == Core::LogLevel::DEBUG) {
            std::cout << "[EventBus] Új observer csatlakozott." << std::endl;
        }
        return lifetime;
    }

    bool SubjectDataSource::hasObservers() const {
        std::lock_guard<std::mutex> lock(emitMutex);
        return events.has_observers();
    }

} // namespace Adaptive::Modules
