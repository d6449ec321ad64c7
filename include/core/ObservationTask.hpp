// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container - ObservationTask (DataSource drain)

#ifndef ADAPTIVE_OBSERVATION_TASK_HPP
#define ADAPTIVE_OBSERVATION_TASK_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "rxcpp/rx.hpp"

#include "core/Capabilities.hpp"

namespace Adaptive::Core {

    /**
     * @brief A hosszú életű observation task: a DataSource callbackjeit egy kapun
     * keresztül továbbítja a konténer dispatch-ébe.
     *
     * A kapu a callbackekkel közösen birtokolt, így egy késve érkező esemény
     * a task megsemmisülése után sem ér el lógó pointert.
     */
    class ObservationTask {
    public:
        using Dispatch = std::function<void(const InteractionEvent&)>;
        using FailureHandler = std::function<void(const std::string&)>;

        ObservationTask(DataSource& source,
                        rxcpp::schedulers::scheduler scope,
                        Dispatch dispatch,
                        FailureHandler onFailure,
                        LogLevel level = LogLevel::LIFECYCLE_ONLY);
        ~ObservationTask();

        ObservationTask(const ObservationTask&) = delete;
        ObservationTask& operator=(const ObservationTask&) = delete;

        void start();

        /**
         * @brief Kooperatív leállítás + join.
         * Visszatérés után egyetlen callback sem fut és nem is fog elindulni.
         */
        void cancelAndJoin();

        [[nodiscard]] bool hasFailed() const;

    private:
        struct Gate {
            std::mutex lock;
            bool open = false;
            bool failed = false;
            Dispatch dispatch;
            FailureHandler onFailure;
        };

        DataSource& source;
        rxcpp::schedulers::scheduler scope;
        std::shared_ptr<Gate> gate;
        rxcpp::composite_subscription subscription;
        LogLevel currentLogLevel;
    };
}

#endif
