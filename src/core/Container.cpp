// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#include "core/Container.hpp"
#include "core/InstructionProbe.hpp"
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace Adaptive::Core {

    namespace {

        // A collaborator hibáját a lépéshez tartozó kategóriába csomagolja
        template<typename Error, typename Fn>
        auto guarded(const std::string& step, Fn&& fn) -> decltype(fn()) {
            try {
                return fn();
            } catch (const ContainerError&) {
                throw;
            } catch (const std::exception& e) {
                throw Error(step + ": " + e.what());
            }
        }

        // RAII: a per-event task végét akkor is jelezni kell, ha a feldolgozás kivétellel száll el
        class EventTaskScope {
        public:
            explicit EventTaskScope(std::function<void()> onExit) : onExit(std::move(onExit)) {}
            ~EventTaskScope() { onExit(); }
            EventTaskScope(const EventTaskScope&) = delete;
            EventTaskScope& operator=(const EventTaskScope&) = delete;
        private:
            std::function<void()> onExit;
        };

        // A control szál csak érvényes konfigurációval indulhat
        const ContainerConfig& validated(const ContainerConfig& config) {
            if (config.pipelineWorkers == 0) {
                throw std::invalid_argument("ContainerConfig.pipelineWorkers must be at least 1");
            }
            if (config.recentWindow == 0) {
                throw std::invalid_argument("ContainerConfig.recentWindow must be at least 1");
            }
            return config;
        }
    }

    Container::Container(std::string userId,
                         LearningEngine& engine,
                         DataStorage& storage,
                         DataSource& source,
                         InstructionList initialInstructions,
                         rxcpp::schedulers::scheduler scope,
                         ContainerConfig config)
        : userId(std::move(userId)),
          engine(engine),
          storage(storage),
          source(source),
          config(validated(config)),
          currentInstructions(std::make_shared<const InstructionList>(std::move(initialInstructions))),
          scope(std::move(scope)),
          cortexWorker(rxcpp::schedulers::make_new_thread().create_worker(cortexLifetime)) {
        for (std::size_t i = 0; i < this->config.pipelineWorkers; ++i) {
            pipelineWorkers.push_back(this->scope.create_worker(pipelineLifetime));
        }
    }

    Container::~Container() {
        try {
            release();
        } catch (const std::exception& e) {
            std::cerr << "[Container][ERROR] Release during destruction failed for user "
                      << userId << ": " << e.what() << std::endl;
        }

        // A még várakozó control taskok eldobódnak, a szál join-ol
        if (cortexLifetime.is_subscribed()) {
            cortexLifetime.unsubscribe();
        }
    }

    // --- Lifecycle ---

    void Container::initialize() {
        std::lock_guard<std::mutex> lock(lifecycleMutex);

        auto current = state.load();
        if (current != ContainerLifecycle::UNINITIALIZED) {
            throw LifecycleError(std::string("initialize() is only valid from UNINITIALIZED, container for user ")
                                 + userId + " is " + lifecycleName(current));
        }

        state = ContainerLifecycle::INITIALIZING;
        log("Initializing...");

        bool storageReady = false;
        bool engineReady = false;
        try {
            storage.initialize();
            storageReady = true;
            log("DataStorage initialized.");

            auto savedState = storage.loadState(userId);
            if (savedState) {
                log("Found saved state: " + std::to_string(savedState->payload.size())
                    + " bytes, version=" + std::to_string(savedState->version));
            } else {
                log("No saved state found, LearningEngine starts fresh.");
            }

            engine.initialize(savedState, scope);
            engineReady = true;
            log("LearningEngine initialized (" + engine.architectureName() + ").");

            if (startObservation()) {
                log("Data observation started.");
            }
        } catch (const std::exception& e) {
            std::cerr << "[Container][ERROR] Initialization failed for user " << userId
                      << ": " << e.what() << std::endl;
            rollbackInitialization(engineReady, storageReady);
            state = ContainerLifecycle::UNINITIALIZED;
            telemetry.state = PipelineState::STOPPED;
            throw InitializationError("Initialization failed for user " + userId + ": " + e.what());
        }

        state = ContainerLifecycle::READY;
        log("Initialization complete.");
    }

    TaskHandle Container::reset() {
        requireOperational("reset()");

        return runLifecycleTask("reset()", [this]() {
            requireState(ContainerLifecycle::READY, "reset()");
            state = ContainerLifecycle::RESETTING;
            log("Resetting...");

            try {
                stopObservation();

                guarded<EngineError>("LearningEngine reset", [this] { engine.reset(); });
                log("LearningEngine reset.");

                guarded<StorageError>("DataStorage deleteUserData", [this] { storage.deleteUserData(userId); });
                log("User data deleted.");
            } catch (const ContainerError& e) {
                std::cerr << "[Container][ERROR] Reset failed for user " << userId << ": " << e.what() << std::endl;
                try {
                    startObservation();
                } catch (const std::exception& restartError) {
                    telemetry.state = PipelineState::FAILED;
                    std::cerr << "[Container][ERROR] Observation restart after failed reset also failed: "
                              << restartError.what() << std::endl;
                }
                state = ContainerLifecycle::READY;
                throw;
            }

            telemetry.reset_window();
            if (startObservation()) {
                telemetry.observation_restarts++;
                log("Data observation restarted.");
            }

            state = ContainerLifecycle::READY;
            log("Reset complete.");
        });
    }

    TaskHandle Container::saveState() {
        requireOperational("saveState()");

        return runLifecycleTask("saveState()", [this]() {
            requireState(ContainerLifecycle::READY, "saveState()");
            log("Saving state...");

            auto current = guarded<EngineError>("LearningEngine getCurrentState",
                                                [this] { return engine.getCurrentState(); });
            guarded<StorageError>("DataStorage saveState",
                                  [this, &current] { storage.saveState(userId, current); });

            log("State saved (" + std::to_string(current.payload.size()) + " bytes, version="
                + std::to_string(current.version) + ").");
        });
    }

    void Container::release() {
        std::lock_guard<std::mutex> lock(lifecycleMutex);

        auto current = state.load();
        if (current == ContainerLifecycle::RELEASED || current == ContainerLifecycle::RELEASING) {
            return;
        }

        state = ContainerLifecycle::RELEASING;
        log("Releasing resources...");

        stopObservation();

        std::exception_ptr firstError;
        try {
            guarded<EngineError>("LearningEngine release", [this] { engine.release(); });
        } catch (const ContainerError& e) {
            std::cerr << "[Container][ERROR] " << e.what() << std::endl;
            firstError = std::current_exception();
        }

        try {
            guarded<StorageError>("DataStorage release", [this] { storage.release(); });
        } catch (const ContainerError& e) {
            std::cerr << "[Container][ERROR] " << e.what() << std::endl;
            if (!firstError) firstError = std::current_exception();
        }

        // Csak a saját workereinket bontjuk le, a hívó scheduler-ét nem
        if (pipelineLifetime.is_subscribed()) {
            pipelineLifetime.unsubscribe();
        }
        broadcast.complete();

        telemetry.state = PipelineState::STOPPED;
        state = ContainerLifecycle::RELEASED;
        log("Resources released.");

        if (firstError) {
            std::rethrow_exception(firstError);
        }
    }

    // --- Queries ---

    PredictionResult Container::getPrediction() {
        requireState(ContainerLifecycle::READY, "getPrediction()");

        auto snapshot = currentInstructions.load();
        PredictionResult prediction;
        try {
            auto recent = storage.loadRecent(userId, config.recentWindow);
            log("Loaded " + std::to_string(recent.size()) + " recent interactions for prediction.",
                LogLevel::DEBUG);
            prediction = InstructionProbe::applyThreshold(engine.predict(recent, *snapshot), *snapshot);
        } catch (const std::exception& e) {
            telemetry.prediction_failures++;
            std::cerr << "[Container][ERROR] Prediction failed for user " << userId << ": " << e.what() << std::endl;
            prediction = std::nullopt;
        }

        publish(prediction);
        return prediction;
    }

    LearningInsights Container::getLearningInsights() {
        requireState(ContainerLifecycle::READY, "getLearningInsights()");
        try {
            return engine.getLearningInsights();
        } catch (const std::exception& e) {
            std::cerr << "[Container][ERROR] Learning insights unavailable: " << e.what() << std::endl;
            return LearningInsights{};
        }
    }

    void Container::updateInstructions(InstructionList instructions) {
        std::string rules;
        for (const auto& instruction : instructions) {
            if (!rules.empty()) rules += ", ";
            rules += InstructionProbe::describe(instruction);
        }
        log("Updating instructions (" + std::to_string(instructions.size()) + " rules)"
            + (rules.empty() ? std::string(".") : ": " + rules + "."));
        currentInstructions.store(std::make_shared<const InstructionList>(std::move(instructions)));
    }

    std::shared_ptr<PredictionSubscription> Container::subscribePredictions(std::size_t capacity) {
        return broadcast.subscribe(capacity == 0 ? config.predictionBuffer : capacity);
    }

    TelemetrySnapshot Container::getTelemetrySnapshot() const {
        return telemetry.snapshot();
    }

    // --- Lifecycle helpers ---

    void Container::requireState(ContainerLifecycle expected, const char* operation) const {
        auto current = state.load();
        if (current != expected) {
            throw LifecycleError(std::string(operation) + " requires " + lifecycleName(expected)
                                 + " but container for user " + userId + " is " + lifecycleName(current));
        }
    }

    void Container::requireOperational(const char* operation) const {
        auto current = state.load();
        if (current == ContainerLifecycle::UNINITIALIZED || current == ContainerLifecycle::INITIALIZING
            || current == ContainerLifecycle::RELEASING || current == ContainerLifecycle::RELEASED) {
            throw LifecycleError(std::string(operation) + " is not valid while container for user "
                                 + userId + " is " + lifecycleName(current));
        }
    }

    TaskHandle Container::runLifecycleTask(const char* operation, std::function<void()> body) {
        auto promise = std::make_shared<std::promise<void>>();
        TaskHandle handle = promise->get_future().share();
        std::string name = operation;

        cortexWorker.schedule([this, promise, name, body = std::move(body)](const rxcpp::schedulers::schedulable&) {
            std::exception_ptr failure;
            {
                std::lock_guard<std::mutex> lock(lifecycleMutex);
                try {
                    body();
                } catch (...) {
                    failure = std::current_exception();
                }
            }

            if (failure) {
                log(name + " failed.", LogLevel::DEBUG);
                promise->set_exception(failure);
            } else {
                promise->set_value();
            }
        });

        return handle;
    }

    bool Container::startObservation() {
        observation = std::make_unique<ObservationTask>(
            source,
            scope,
            [this](const InteractionEvent& event) { dispatchEvent(event); },
            [this](const std::string& reason) { onObservationFailed(reason); },
            config.logLevel);

        // start() előtt: egy szinkron hibázó forrás FAILED-je ne íródjon felül
        telemetry.state = PipelineState::OBSERVING;
        try {
            observation->start();
        } catch (...) {
            observation.reset();
            telemetry.state = PipelineState::STOPPED;
            throw;
        }

        if (observation->hasFailed()) {
            log("Data observation ended immediately, stream is unavailable.");
            return false;
        }
        return true;
    }

    void Container::rollbackInitialization(bool engineReady, bool storageReady) {
        if (engineReady) {
            try {
                engine.release();
            } catch (const std::exception& e) {
                std::cerr << "[Container][ERROR] LearningEngine release during rollback failed: "
                          << e.what() << std::endl;
            }
        }
        if (storageReady) {
            try {
                storage.release();
            } catch (const std::exception& e) {
                std::cerr << "[Container][ERROR] DataStorage release during rollback failed: "
                          << e.what() << std::endl;
            }
        }
    }

    void Container::stopObservation() {
        telemetry.state = PipelineState::DRAINING;
        if (observation) {
            observation->cancelAndJoin();
            observation.reset();
        }
        drainEventTasks();
        telemetry.state = PipelineState::STOPPED;
    }

    // --- Event plane ---

    void Container::dispatchEvent(const InteractionEvent& event) {
        telemetry.received_events++;

        // Snapshot a dispatch pillanatában; a későbbi updateInstructions erre már nem hat
        InstructionSnapshot snapshot = currentInstructions.load();

        beginEventTask();
        const auto& worker = pipelineWorkers[nextWorker.fetch_add(1) % pipelineWorkers.size()];
        worker.schedule([this, event, snapshot](const rxcpp::schedulers::schedulable&) {
            EventTaskScope taskScope([this] { endEventTask(); });
            processEvent(event, *snapshot);
        });
    }

    void Container::processEvent(const InteractionEvent& event, const InstructionList& instructions) {
        if (InstructionProbe::evaluate(event, instructions) == EventVerdict::IGNORE) {
            telemetry.ignored_events++;
            log("Ignoring event type '" + event.type + "' based on instructions.", LogLevel::DEBUG);
            return;
        }

        try {
            guarded<StorageError>("DataStorage saveInteraction", [this, &event] { storage.saveInteraction(event); });
            telemetry.stored_events++;

            // A tanítás handle-jére nem várunk: az ingest nem lassulhat a tréning miatt
            guarded<EngineError>("LearningEngine trainStep", [this, &event] { return engine.trainStep(event); });
            telemetry.trained_events++;

            auto recent = guarded<StorageError>("DataStorage loadRecent",
                                                [this] { return storage.loadRecent(userId, config.recentWindow); });
            auto prediction = guarded<EngineError>("LearningEngine predict",
                                                   [this, &recent, &instructions] { return engine.predict(recent, instructions); });

            publish(InstructionProbe::applyThreshold(std::move(prediction), instructions));
            log("Processed event '" + event.type + "'.", LogLevel::DEBUG);
        } catch (const ContainerError& e) {
            telemetry.failed_events++;
            std::cerr << "[Pipeline][ERROR] Event '" << event.type << "' for user " << userId
                      << " failed: " << e.what() << std::endl;
            publish(std::nullopt);
        }
    }

    void Container::onObservationFailed(const std::string& reason) {
        telemetry.observation_failures++;
        telemetry.state = PipelineState::FAILED;
        std::cerr << "[Pipeline][ERROR] DataSource stream for user " << userId
                  << " ended, observation stopped: " << reason << std::endl;
    }

    void Container::publish(const PredictionResult& prediction) {
        telemetry.record_prediction(prediction.has_value());
        broadcast.publish(prediction);
    }

    void Container::beginEventTask() {
        {
            std::lock_guard<std::mutex> lock(inFlightMutex);
            inFlight++;
        }
        telemetry.task_started();
    }

    void Container::endEventTask() {
        telemetry.task_finished();
        {
            std::lock_guard<std::mutex> lock(inFlightMutex);
            inFlight--;
        }
        inFlightDrained.notify_all();
    }

    void Container::drainEventTasks() {
        std::unique_lock<std::mutex> lock(inFlightMutex);
        inFlightDrained.wait(lock, [this] { return inFlight == 0; });
    }

    void Container::log(const std::string& message, LogLevel minimum) const {
        if (config.logLevel == LogLevel::SILENT) return;
        if (minimum == LogLevel::DEBUG && config.logLevel != LogLevel::DEBUG) return;
        std::cout << "[Container] user=" << userId << ": " << message << std::endl;
    }

} // namespace Adaptive::Core
