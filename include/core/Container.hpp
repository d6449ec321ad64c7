// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container
// Container: per-user orchestrator of engine, storage and event source

#ifndef ADAPTIVE_CONTAINER_HPP
#define ADAPTIVE_CONTAINER_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "rxcpp/rx.hpp"

#include "ContainerTypes.hpp"
#include "core/Capabilities.hpp"
#include "core/ContainerErrors.hpp"
#include "core/ObservationTask.hpp"
#include "core/PredictionBroadcast.hpp"
#include "telemetry/PipelineTelemetry.hpp"

namespace Adaptive::Core {

    /**
     * @brief Egy felhasználó adaptív tanulási konténere.
     *
     * Két sík, a Dual-Bus mintára:
     *  - Event plane: a hívó scheduler-én futó per-event taskok (storage + tanítás + predikció).
     *  - Control plane: egyetlen dedikált szál a reset/saveState taskoknak.
     *
     * A lifecycle műveletek (initialize, reset, saveState, release) egyetlen mutexen
     * szerializálódnak; a per-event út ezen kívül fut. Az engine, a storage és a source
     * nem birtokolt referenciák, élettartamukat a hívó kezeli.
     */
    class Container {
    public:
        Container(std::string userId,
                  LearningEngine& engine,
                  DataStorage& storage,
                  DataSource& source,
                  InstructionList initialInstructions,
                  rxcpp::schedulers::scheduler scope,
                  ContainerConfig config = {});
        ~Container();

        Container(const Container&) = delete;
        Container& operator=(const Container&) = delete;

        // --- Lifecycle ---

        /**
         * @brief storage.initialize -> loadState -> engine.initialize -> observation indítása.
         * Hibánál InitializationError: a már inicializált collaboratorok release-t kapnak,
         * a konténer UNINITIALIZED marad (újrapróbálható).
         */
        void initialize();

        /**
         * @brief Observation leállítása és kiürítése, engine.reset, deleteUserData, újraindítás.
         * A handle befejezésekor az engine üres és a storage törölve van.
         */
        [[nodiscard]] TaskHandle reset();

        // Snapshot mentés; az observation közben fut tovább.
        [[nodiscard]] TaskHandle saveState();

        // Idempotens; a második hívás azonnal visszatér.
        void release();

        // --- Queries ---

        /**
         * @brief Pull alapú predikció: recent -> predict -> publish -> return.
         * Storage/engine hiba esetén std::nullopt (és az is publikálásra kerül).
         */
        PredictionResult getPrediction();

        LearningInsights getLearningInsights();

        // Lock nélküli atomi csere; csak az ezután dispatch-elt eseményekre hat.
        void updateInstructions(InstructionList instructions);

        // capacity == 0: a konfigurált predictionBuffer. Csak postafiókos előfizetés van,
        // így egy lassú fogyasztó sem tarthatja fel a publish()-t.
        std::shared_ptr<PredictionSubscription> subscribePredictions(std::size_t capacity = 0);

        // --- Accessors ---
        const std::string& getUserId() const { return userId; }
        ContainerLifecycle lifecycle() const { return state.load(); }
        InstructionSnapshot instructions() const { return currentInstructions.load(); }
        const ContainerConfig& getConfig() const { return config; }
        [[nodiscard]] TelemetrySnapshot getTelemetrySnapshot() const;

    private:
        // --- Identity & collaborators ---
        const std::string userId;
        LearningEngine& engine;
        DataStorage& storage;
        DataSource& source;
        const ContainerConfig config;

        // --- Lifecycle state ---
        std::mutex lifecycleMutex;
        std::atomic<ContainerLifecycle> state{ContainerLifecycle::UNINITIALIZED};
        std::unique_ptr<ObservationTask> observation;

        std::atomic<InstructionSnapshot> currentInstructions;

        // --- Event plane (hívó scheduler-e, saját lifetime) ---
        rxcpp::schedulers::scheduler scope;
        rxcpp::composite_subscription pipelineLifetime;
        std::vector<rxcpp::schedulers::worker> pipelineWorkers;
        std::atomic<std::size_t> nextWorker{0};

        std::mutex inFlightMutex;
        std::condition_variable inFlightDrained;
        std::size_t inFlight = 0;

        // --- Control plane (dedikált szál) ---
        rxcpp::composite_subscription cortexLifetime;
        rxcpp::schedulers::worker cortexWorker;

        PredictionBroadcast broadcast;
        PipelineTelemetry telemetry;

        // Lifecycle lock alatt hívandók
        void requireState(ContainerLifecycle expected, const char* operation) const;
        // false: a forrás már az indításkor hibával zárult (a kudarc rögzítve van)
        bool startObservation();
        void stopObservation();
        void rollbackInitialization(bool engineReady, bool storageReady);

        void requireOperational(const char* operation) const;
        TaskHandle runLifecycleTask(const char* operation, std::function<void()> body);

        void dispatchEvent(const InteractionEvent& event);
        void processEvent(const InteractionEvent& event, const InstructionList& instructions);
        void onObservationFailed(const std::string& reason);
        void publish(const PredictionResult& prediction);

        void beginEventTask();
        void endEventTask();
        void drainEventTasks();

        void log(const std::string& message, LogLevel minimum = LogLevel::LIFECYCLE_ONLY) const;
    };
}

#endif // ADAPTIVE_CONTAINER_HPP
