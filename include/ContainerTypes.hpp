// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container
// Container Types: the value objects shared by the container and its capabilities

#ifndef ADAPTIVE_CONTAINER_TYPES_HPP
#define ADAPTIVE_CONTAINER_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "utils/ConfigDefaults.hpp"

namespace Adaptive::Core {

    /**
     * @brief Egyetlen felhasználói interakció (metaadat, nem tartalom).
     * Létrehozás után nem módosul; a DataSource állítja elő.
     */
    struct InteractionEvent {
        std::string type;
        std::map<std::string, std::string> attributes;
        int64_t timestamp = 0;
        std::string userId;

        bool operator==(const InteractionEvent&) const = default;
    };

    /**
     * @brief A tanult állapot szerializált lenyomata.
     * A konténer soha nem értelmezi a payload-ot, csak mozgatja az engine és a storage között.
     */
    struct ContainerState {
        std::vector<uint8_t> payload;
        int version = 1;

        bool operator==(const ContainerState&) const = default;
    };

    struct Prediction {
        std::string suggestion;
        float confidence = 0.0f; // [0, 1]
        std::string category;
        std::map<std::string, std::string> metadata;

        bool operator==(const Prediction&) const = default;
    };

    // std::nullopt = nincs elég magabiztos javaslat
    using PredictionResult = std::optional<Prediction>;

    // --- Instructions (closed set) ---

    struct IgnoreEventType {
        std::string type;
        bool operator==(const IgnoreEventType&) const = default;
    };

    struct MinConfidence {
        float threshold = 0.0f;
        bool operator==(const MinConfidence&) const = default;
    };

    using Instruction = std::variant<IgnoreEventType, MinConfidence>;
    using InstructionList = std::vector<Instruction>;

    // Read-many, replaced as a whole.
    using InstructionSnapshot = std::shared_ptr<const InstructionList>;

    struct LearningInsights {
        uint64_t interactionCount = 0;
        float progressEstimate = 0.0f; // [0, 1]
        std::map<std::string, double> customMetrics;
    };

    // Async completion of reset/saveState/trainStep; get() rethrows the failure.
    using TaskHandle = std::shared_future<void>;

    enum class ContainerLifecycle {
        UNINITIALIZED,
        INITIALIZING,
        READY,
        RESETTING,
        RELEASING,
        RELEASED
    };

    enum class LogLevel { SILENT, LIFECYCLE_ONLY, DEBUG };

    inline const char* lifecycleName(ContainerLifecycle state) {
        switch (state) {
            case ContainerLifecycle::UNINITIALIZED: return "UNINITIALIZED";
            case ContainerLifecycle::INITIALIZING:  return "INITIALIZING";
            case ContainerLifecycle::READY:         return "READY";
            case ContainerLifecycle::RESETTING:     return "RESETTING";
            case ContainerLifecycle::RELEASING:     return "RELEASING";
            case ContainerLifecycle::RELEASED:      return "RELEASED";
        }
        return "UNKNOWN";
    }

    /**
     * @brief A konténer futásidejű konfigurációja.
     * Az alapértékek a ConfigDefaults-ból jönnek, a ContainerBuilder írhatja felül.
     */
    struct ContainerConfig {
        // Hány legutóbbi interakció kerül a predict() kontextusába
        std::size_t recentWindow = AdaptiveDefaults::RECENT_WINDOW;

        // Per-event workerek száma a hívó schedulerén (round robin)
        std::size_t pipelineWorkers = AdaptiveDefaults::PIPELINE_WORKERS;

        // Előfizetőnkénti postafiók mérete (drop-oldest)
        std::size_t predictionBuffer = AdaptiveDefaults::PREDICTION_BUFFER;

        LogLevel logLevel = LogLevel::LIFECYCLE_ONLY;
    };

} // namespace Adaptive::Core

#endif // ADAPTIVE_CONTAINER_TYPES_HPP
