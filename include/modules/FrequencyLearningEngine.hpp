// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#ifndef FREQUENCY_LEARNING_ENGINE_HPP
#define FREQUENCY_LEARNING_ENGINE_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "rxcpp/rx.hpp"

#include "core/Capabilities.hpp"

namespace Adaptive::Modules {

    /**
     * @brief "Mi jön ezután?" tanuló: eseménytípus -> következő típus átmenet-számlálók.
     *
     * A predikció a legutóbbi esemény típusának leggyakoribb követőjét adja,
     * confidence = a követő részaránya. A trainStep a hívó scheduler-ének
     * saját workerén fut, így a pipeline nem vár rá.
     */
    class FrequencyLearningEngine : public Core::LearningEngine {
    public:
        using TransitionTable = std::map<std::string, std::map<std::string, uint64_t>>;

        static constexpr int STATE_VERSION = 1;
        static constexpr const char* PREDICTION_CATEGORY = "next_event";

        explicit FrequencyLearningEngine(Core::LogLevel level = Core::LogLevel::LIFECYCLE_ONLY);
        ~FrequencyLearningEngine() override;

        void initialize(const std::optional<Core::ContainerState>& savedState,
                        rxcpp::schedulers::scheduler scope) override;
        Core::TaskHandle trainStep(const Core::InteractionEvent& event) override;
        Core::PredictionResult predict(const std::vector<Core::InteractionEvent>& recent,
                                       const Core::InstructionList& instructions) override;
        Core::ContainerState getCurrentState() override;
        void reset() override;
        void release() override;
        Core::LearningInsights getLearningInsights() override;
        std::string architectureName() const override { return "FrequencyTransition"; }

        // Szinkron tanulás (a trainStep háttér taskja is ezt hívja)
        void learn(const Core::InteractionEvent& event);

        // Megvárja a még futó trainStep taskokat
        void awaitTraining();

        static Core::ContainerState serialize(const TransitionTable& table,
                                              const std::string& lastType,
                                              uint64_t interactionCount);

        struct Model {
            TransitionTable transitions;
            std::string lastType;
            uint64_t interactionCount = 0;
        };

        // EngineError, ha a payload sérült vagy a verzió ismeretlen
        static Model deserialize(const Core::ContainerState& state);

    private:
        void requireInitialized(const char* operation) const;
        void finishTraining();

        std::atomic<bool> initialized{false};
        Core::LogLevel currentLogLevel;

        mutable std::mutex modelMutex;
        Model model;

        std::mutex pendingMutex;
        std::condition_variable trainingDone;
        std::size_t pendingTraining = 0;

        rxcpp::composite_subscription trainingLifetime;
        std::optional<rxcpp::schedulers::worker> trainingWorker;
    };
}

#endif
