// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#ifndef PREDICTION_BROADCAST_HPP
#define PREDICTION_BROADCAST_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include "rxcpp/rx.hpp"

#include "ContainerTypes.hpp"

namespace Adaptive::Core {

    /**
     * @brief Egy előfizető korlátos postafiókja.
     * Telítettségnél a legrégebbi predikció esik ki, a publikáló soha nem vár.
     * A külső optional azt jelzi, volt-e érték; a belső a predikció maga (std::nullopt = nincs predikció).
     */
    class PredictionSubscription {
    public:
        explicit PredictionSubscription(std::size_t capacity);
        ~PredictionSubscription();

        PredictionSubscription(const PredictionSubscription&) = delete;
        PredictionSubscription& operator=(const PredictionSubscription&) = delete;

        std::optional<PredictionResult> tryNext();
        std::optional<PredictionResult> waitNext(std::chrono::milliseconds timeout);

        void unsubscribe();
        [[nodiscard]] bool isSubscribed() const;

        // A stream lezárult (a konténer release-elt) és a postafiók üres
        [[nodiscard]] bool isClosed() const;

        std::size_t pending() const;
        uint64_t received() const;
        uint64_t dropped() const;

    private:
        friend class PredictionBroadcast;

        void deliver(const PredictionResult& prediction);
        void close();

        const std::size_t capacity;
        mutable std::mutex mutex;
        std::condition_variable ready;
        std::deque<PredictionResult> mailbox;
        uint64_t receivedCount = 0;
        uint64_t droppedCount = 0;
        bool completed = false;

        rxcpp::composite_subscription lifetime;
    };

    /**
     * @brief Több előfizetős, replay nélküli predikció-csatorna.
     * Facade egy rxcpp subject fölött: az új előfizető csak a feliratkozás utáni értékeket látja.
     */
    class PredictionBroadcast {
    private:
        rxcpp::subjects::subject<PredictionResult> channel;

        // A subject on_next nem hívható párhuzamosan (Rx szerződés). A zár alatt csak
        // postafiókba írás fut, ezért nem blokkolhat és nem hívhat vissza a konténerbe.
        std::mutex publishMutex;
        bool completed = false;

    public:
        PredictionBroadcast() = default;

        void publish(const PredictionResult& prediction);

        // Lezárja a streamet; utána a publish no-op.
        void complete();

        std::shared_ptr<PredictionSubscription> subscribe(std::size_t capacity);

        [[nodiscard]] bool hasSubscribers() const;
    };
}

#endif
