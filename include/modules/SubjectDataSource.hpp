// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#ifndef SUBJECT_DATA_SOURCE_HPP
#define SUBJECT_DATA_SOURCE_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include "rxcpp/rx.hpp"

#include "core/Capabilities.hpp"

namespace Adaptive::Modules {

    /**
     * @brief Rx subject alapú interakció-busz.
     * Az alkalmazás emit()-tel tolja be az eseményeket; minden observe() hívás
     * külön feliratkozás, amely a hívó scheduler-ének egy workerén kapja meg őket.
     * fail() után a következő observe() friss subject-re iratkozik (újraindítható forrás).
     */
    class SubjectDataSource : public Core::DataSource {
    private:
        rxcpp::subjects::subject<Core::InteractionEvent> events;
        bool terminated = false;

        // Rx szerződés: on_next/on_error nem fut párhuzamosan
        mutable std::mutex emitMutex;
        std::atomic<uint64_t> emitted{0};
        std::atomic<uint64_t> observeCalls{0};
        Core::LogLevel currentLogLevel;

    public:
        explicit SubjectDataSource(Core::LogLevel level = Core::LogLevel::LIFECYCLE_ONLY);

        // Nyers esemény betolása a rendszerbe
        void emit(const Core::InteractionEvent& event);

        // A stream hibával zárul; az élő feliratkozások ObservationError-t kapnak.
        void fail(const std::string& reason);

        rxcpp::composite_subscription observe(Core::EventCallback onEvent,
                                              Core::ObservationErrorCallback onError,
                                              rxcpp::schedulers::scheduler scope) override;

        [[nodiscard]] bool hasObservers() const;
        uint64_t emittedCount() const { return emitted.load(); }
        uint64_t observeCount() const { return observeCalls.load(); }
    };
}

#endif
