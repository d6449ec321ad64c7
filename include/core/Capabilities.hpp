// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container
// Pluggable capabilities consumed by the Container

#ifndef ADAPTIVE_CAPABILITIES_HPP
#define ADAPTIVE_CAPABILITIES_HPP

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "rxcpp/rx.hpp"

#include "ContainerTypes.hpp"

namespace Adaptive::Core {

    /**
     * @brief Inkrementális tanulás és predikció.
     * A konténer több per-event taskból párhuzamosan hívhatja, az implementációnak
     * belsőleg szálbiztosnak kell lennie.
     */
    class LearningEngine {
    public:
        virtual ~LearningEngine() = default;

        /**
         * @param savedState Korábban mentett állapot, vagy std::nullopt friss indulásnál.
         * @param scope A hívó scheduler-e a háttér tanításhoz. Az engine csak saját workereit bonthatja le.
         */
        virtual void initialize(const std::optional<ContainerState>& savedState,
                                rxcpp::schedulers::scheduler scope) = 0;

        // Nem blokkol: a tanítás a háttérben fut, a handle a befejezést jelzi.
        virtual TaskHandle trainStep(const InteractionEvent& event) = 0;

        virtual PredictionResult predict(const std::vector<InteractionEvent>& recent,
                                         const InstructionList& instructions) = 0;

        virtual ContainerState getCurrentState() = 0;

        // "Üres lap": minden tanult paraméter törlése
        virtual void reset() = 0;

        virtual void release() = 0;

        virtual LearningInsights getLearningInsights() { return LearningInsights{}; }

        virtual std::string architectureName() const { return "Unknown Architecture"; }
    };

    /**
     * @brief Állapot és interakció-történet perzisztencia.
     */
    class DataStorage {
    public:
        virtual ~DataStorage() = default;

        virtual void initialize() = 0;
        virtual void saveState(const std::string& userId, const ContainerState& state) = 0;
        virtual std::optional<ContainerState> loadState(const std::string& userId) = 0;
        virtual void saveInteraction(const InteractionEvent& event) = 0;

        // Legfrissebb elöl, legfeljebb `limit` elem; `type` megadásakor csak az adott típus.
        virtual std::vector<InteractionEvent> loadRecent(const std::string& userId,
                                                         std::size_t limit,
                                                         const std::optional<std::string>& type = std::nullopt) = 0;

        virtual void deleteUserData(const std::string& userId) = 0;
        virtual void release() = 0;
    };

    using EventCallback = std::function<void(const InteractionEvent&)>;
    using ObservationErrorCallback = std::function<void(std::exception_ptr)>;

    /**
     * @brief Élő interakció-stream.
     * Az observe() visszatérési értéke a megszakítható handle: unsubscribe() után
     * a forrás nem hívja többé a callbackeket.
     */
    class DataSource {
    public:
        virtual ~DataSource() = default;

        virtual rxcpp::composite_subscription observe(EventCallback onEvent,
                                                      ObservationErrorCallback onError,
                                                      rxcpp::schedulers::scheduler scope) = 0;
    };
}

#endif // ADAPTIVE_CAPABILITIES_HPP
