// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#include "core/PredictionBroadcast.hpp"
#include <algorithm>
#include <iostream>

namespace Adaptive::Core {

    PredictionSubscription::PredictionSubscription(std::size_t capacity)
        : capacity(std::max<std::size_t>(capacity, 1)) {}

    PredictionSubscription::~PredictionSubscription() {
        unsubscribe();
    }

    void PredictionSubscription::deliver(const PredictionResult& prediction) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (mailbox.size() >= capacity) {
                mailbox.pop_front();
                droppedCount++;
            }
            mailbox.push_back(prediction);
            receivedCount++;
        }
        ready.notify_one();
    }

    void PredictionSubscription::close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            completed = true;
        }
        ready.notify_all();
    }

    std::optional<PredictionResult> PredictionSubscription::tryNext() {
        std::lock_guard<std::mutex> lock(mutex);
        if (mailbox.empty()) {
            return std::nullopt;
        }
        PredictionResult next = std::move(mailbox.front());
        mailbox.pop_front();
        return next;
    }

    std::optional<PredictionResult> PredictionSubscription::waitNext(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        ready.wait_for(lock, timeout, [this] { return !mailbox.empty() || completed; });
        if (mailbox.empty()) {
            return std::nullopt;
        }
        PredictionResult next = std::move(mailbox.front());
        mailbox.pop_front();
        return next;
    }

    void PredictionSubscription::unsubscribe() {
        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }
    }

    bool PredictionSubscription::isSubscribed() const {
        return lifetime.is_subscribed();
    }

    bool PredictionSubscription::isClosed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return completed && mailbox.empty();
    }

    std::size_t PredictionSubscription::pending() const {
        std::lock_guard<std::mutex> lock(mutex);
        return mailbox.size();
    }

    uint64_t PredictionSubscription::received() const {
        std::lock_guard<std::mutex> lock(mutex);
        return receivedCount;
    }

    uint64_t PredictionSubscription::dropped() const {
        std::lock_guard<std::mutex> lock(mutex);
        return droppedCount;
    }

    void PredictionBroadcast::publish(const PredictionResult& prediction) {
        std::lock_guard<std::mutex> lock(publishMutex);
        if (completed) return;
        channel.get_subscriber().on_next(prediction);
    }

    void PredictionBroadcast::complete() {
        std::lock_guard<std::mutex> lock(publishMutex);
        if (completed) return;
        completed = true;
        channel.get_subscriber().on_completed();
    }

    std::shared_ptr<PredictionSubscription> PredictionBroadcast::subscribe(std::size_t capacity) {
        auto subscription = std::make_shared<PredictionSubscription>(capacity);
        std::weak_ptr<PredictionSubscription> weak = subscription;

        // A handler csak a postafiókba ír, így a publish() sosem áll meg egy lassú fogyasztón
        channel.get_observable().subscribe(
            subscription->lifetime,
            [weak](const PredictionResult& prediction) {
                if (auto target = weak.lock()) {
                    target->deliver(prediction);
                }
            },
            [weak](std::exception_ptr) {
                if (auto target = weak.lock()) {
                    target->close();
                }
            },
            [weak]() {
                if (auto target = weak.lock()) {
                    target->close();
                }
            });

        return subscription;
    }

    bool PredictionBroadcast::hasSubscribers() const {
        return channel.has_observers();
    }

} // namespace Adaptive::Core
