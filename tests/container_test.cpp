// Container lifecycle and pipeline tests

#include <cassert>
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "core/Container.hpp"
#include "core/ContainerBuilder.hpp"
#include "modules/FrequencyLearningEngine.hpp"
#include "modules/SubjectDataSource.hpp"
#include "TestSupport.hpp"

using namespace Adaptive;
using namespace Adaptive::Core;
using namespace Adaptive::Testing;

namespace {

Prediction scripted(const std::string& suggestion, float confidence) {
    Prediction p;
    p.suggestion = suggestion;
    p.confidence = confidence;
    p.category = "scripted";
    return p;
}

}

void test_initialize_with_empty_storage() {
    std::cout << "Testing initialize with empty storage..." << std::endl;

    RecordingEngine engine;
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);

    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    assert(container.lifecycle() == ContainerLifecycle::UNINITIALIZED);

    container.initialize();

    assert(container.lifecycle() == ContainerLifecycle::READY);
    assert(engine.initializeCalls == 1);
    assert(!engine.initializedWith().has_value());
    assert(storage.initializeCount() == 1);
    assert(source.hasObservers());
    assert(container.getTelemetrySnapshot().state == PipelineState::OBSERVING);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_initialize_twice_is_rejected() {
    std::cout << "Testing second initialize is a lifecycle error..." << std::endl;

    RecordingEngine engine;
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    bool threw = false;
    try {
        container.initialize();
    } catch (const LifecycleError&) {
        threw = true;
    }
    assert(threw);
    assert(engine.initializeCalls == 1);
    assert(container.lifecycle() == ContainerLifecycle::READY);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_failed_initialize_can_be_retried() {
    std::cout << "Testing failed initialize leaves container retryable..." << std::endl;

    RecordingEngine engine;
    FaultyStorage storage;
    storage.failInitialize = true;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());

    bool threw = false;
    try {
        container.initialize();
    } catch (const InitializationError& e) {
        threw = true;
        assert(std::string(e.what()).find("disk unavailable") != std::string::npos);
    }
    assert(threw);
    assert(container.lifecycle() == ContainerLifecycle::UNINITIALIZED);
    assert(engine.initializeCalls == 0);
    assert(!source.hasObservers());

    bool predictionRejected = false;
    try {
        (void)container.getPrediction();
    } catch (const LifecycleError&) {
        predictionRejected = true;
    }
    assert(predictionRejected);

    storage.failInitialize = false;
    container.initialize();
    assert(container.lifecycle() == ContainerLifecycle::READY);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_engine_failure_during_initialize() {
    std::cout << "Testing engine failure during initialize..." << std::endl;

    RecordingEngine engine;
    engine.failInitialize = true;
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());

    bool threw = false;
    try {
        container.initialize();
    } catch (const InitializationError&) {
        threw = true;
    }
    assert(threw);
    assert(container.lifecycle() == ContainerLifecycle::UNINITIALIZED);
    assert(!source.hasObservers());
    // a már felhúzott storage visszaáll, az engine nem
    assert(storage.releaseCount() == 1);
    assert(engine.releaseCalls == 0);

    std::cout << "  PASS" << std::endl;
}

void test_failed_observe_rolls_back_collaborators() {
    std::cout << "Testing failed observe releases engine and storage..." << std::endl;

    FaultyStorage storage;
    storage.initialize();
    Modules::FrequencyLearningEngine::TransitionTable table;
    table["open"]["read"] = 5;
    storage.saveState("alice", Modules::FrequencyLearningEngine::serialize(table, "open", 5));
    storage.release();

    Modules::FrequencyLearningEngine engine(LogLevel::SILENT);
    ScriptedSource source;
    source.throwOnObserve = true;
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());

    bool threw = false;
    try {
        container.initialize();
    } catch (const InitializationError&) {
        threw = true;
    }
    assert(threw);
    assert(container.lifecycle() == ContainerLifecycle::UNINITIALIZED);
    assert(container.getTelemetrySnapshot().state == PipelineState::STOPPED);
    assert(storage.releaseCount() == 2);

    // Újrapróbálás: az engine ismét a mentett állapotból indul
    source.throwOnObserve = false;
    container.initialize();
    assert(container.lifecycle() == ContainerLifecycle::READY);
    assert(source.observeCalls == 2);
    assert(engine.getLearningInsights().interactionCount == 5);

    auto prediction = container.getPrediction();
    assert(!prediction.has_value());
    source.emit(makeEvent("open", 1, "alice"));
    prediction = container.getPrediction();
    assert(prediction.has_value());
    assert(prediction->suggestion == "read");

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_invalid_transitions() {
    std::cout << "Testing operations in invalid states..." << std::endl;

    RecordingEngine engine;
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());

    auto expectLifecycleError = [](auto&& call) {
        try {
            call();
        } catch (const LifecycleError&) {
            return true;
        }
        return false;
    };

    assert(expectLifecycleError([&] { (void)container.reset(); }));
    assert(expectLifecycleError([&] { (void)container.saveState(); }));
    assert(expectLifecycleError([&] { (void)container.getPrediction(); }));

    container.initialize();
    container.release();

    assert(container.lifecycle() == ContainerLifecycle::RELEASED);
    assert(expectLifecycleError([&] { container.initialize(); }));
    assert(expectLifecycleError([&] { (void)container.reset(); }));
    assert(expectLifecycleError([&] { (void)container.saveState(); }));
    assert(expectLifecycleError([&] { (void)container.getPrediction(); }));

    std::cout << "  PASS" << std::endl;
}

void test_reset_clears_learning_and_history() {
    std::cout << "Testing reset clears model and stored interactions..." << std::endl;

    Modules::FrequencyLearningEngine engine(LogLevel::SILENT);
    Modules::InMemoryDataStorage storage(LogLevel::SILENT);
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    const std::vector<std::string> session = {"open", "edit", "open", "edit", "open"};
    for (std::size_t i = 0; i < session.size(); ++i) {
        source.emit(makeEvent(session[i], static_cast<int64_t>(i + 1), "alice"));
    }

    assert(storage.interactionCount("alice") == 5);
    auto before = container.getPrediction();
    assert(before.has_value());
    assert(before->suggestion == "edit");

    container.reset().get();

    assert(container.lifecycle() == ContainerLifecycle::READY);
    assert(storage.interactionCount("alice") == 0);
    assert(!storage.hasState("alice"));
    assert(!container.getPrediction().has_value());
    assert(engine.getLearningInsights().interactionCount == 0);

    // Az observation újraindult: az új események ismét bekerülnek
    source.emit(makeEvent("open", 10, "alice"));
    assert(storage.interactionCount("alice") == 1);
    assert(container.getTelemetrySnapshot().observation_restarts == 1);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_failed_reset_keeps_container_ready() {
    std::cout << "Testing failed reset reports through handle..." << std::endl;

    RecordingEngine engine;
    engine.failReset = true;
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();
    source.emit(makeEvent("open", 1, "alice"));

    bool threw = false;
    try {
        container.reset().get();
    } catch (const EngineError&) {
        threw = true;
    }
    assert(threw);
    assert(container.lifecycle() == ContainerLifecycle::READY);
    assert(storage.interactionCount("alice") == 1);

    source.emit(makeEvent("edit", 2, "alice"));
    assert(storage.interactionCount("alice") == 2);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_ignored_events_are_never_stored() {
    std::cout << "Testing ignore instruction filters events..." << std::endl;

    RecordingEngine engine;
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {IgnoreEventType{"noise"}},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    source.emit(makeEvent("click", 1, "alice"));
    assert(storage.interactionCount("alice") == 1);

    source.emit(makeEvent("noise", 2, "alice"));
    assert(storage.interactionCount("alice") == 1);
    assert(engine.trainCalls == 1);

    auto telemetry = container.getTelemetrySnapshot();
    assert(telemetry.received == 2);
    assert(telemetry.ignored == 1);
    assert(telemetry.stored == 1);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_instruction_update_applies_to_later_events() {
    std::cout << "Testing instruction update mid-stream..." << std::endl;

    RecordingEngine engine;
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    source.emit(makeEvent("scroll", 1, "alice"));
    container.updateInstructions({IgnoreEventType{"scroll"}});
    source.emit(makeEvent("scroll", 2, "alice"));

    auto stored = storage.loadRecent("alice", 10);
    assert(stored.size() == 1);
    assert(stored[0].timestamp == 1);
    assert(stored[0].attributes.at("seq") == "1");
    assert(container.instructions()->size() == 1);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_saved_state_is_restored_exactly() {
    std::cout << "Testing saveState round trip through storage..." << std::endl;

    FaultyStorage storage;
    ContainerState snapshot;
    snapshot.payload = {0x01, 0x02, 0x03, 0xff, 0x00};
    snapshot.version = 7;

    {
        RecordingEngine engine;
        engine.setState(snapshot);
        Modules::SubjectDataSource source(LogLevel::SILENT);
        Container container("alice", engine, storage, source, {},
                            rxcpp::schedulers::make_current_thread(), quietConfig());
        container.initialize();
        container.saveState().get();
        assert(storage.hasState("alice"));
        container.release();
    }

    RecordingEngine restored;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", restored, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    auto received = restored.initializedWith();
    assert(received.has_value());
    assert(*received == snapshot);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_frequency_engine_survives_restart() {
    std::cout << "Testing learned model survives save and restart..." << std::endl;

    Modules::InMemoryDataStorage storage(LogLevel::SILENT);
    {
        Modules::FrequencyLearningEngine engine(LogLevel::SILENT);
        Modules::SubjectDataSource source(LogLevel::SILENT);
        Container container("bob", engine, storage, source, {},
                            rxcpp::schedulers::make_current_thread(), quietConfig());
        container.initialize();
        source.emit(makeEvent("login", 1, "bob"));
        source.emit(makeEvent("inbox", 2, "bob"));
        source.emit(makeEvent("login", 3, "bob"));
        container.saveState().get();
        container.release();
    }

    Modules::FrequencyLearningEngine engine(LogLevel::SILENT);
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("bob", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    assert(engine.getLearningInsights().interactionCount == 3);
    auto prediction = container.getPrediction();
    assert(prediction.has_value());
    assert(prediction->suggestion == "inbox");

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_release_is_idempotent() {
    std::cout << "Testing release twice releases collaborators once..." << std::endl;

    RecordingEngine engine;
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();
    auto subscription = container.subscribePredictions();

    container.release();
    container.release();

    assert(engine.releaseCalls == 1);
    assert(storage.releaseCount() == 1);
    assert(container.lifecycle() == ContainerLifecycle::RELEASED);
    assert(subscription->isClosed());
    assert(container.getTelemetrySnapshot().state == PipelineState::STOPPED);

    std::cout << "  PASS" << std::endl;
}

void test_release_reports_first_error_and_finishes() {
    std::cout << "Testing release with failing storage..." << std::endl;

    RecordingEngine engine;
    FaultyStorage storage;
    storage.failRelease = true;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    bool threw = false;
    try {
        container.release();
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);
    assert(engine.releaseCalls == 1);
    assert(container.lifecycle() == ContainerLifecycle::RELEASED);

    container.release();
    assert(storage.releaseCount() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_subscribers_see_no_replay() {
    std::cout << "Testing late subscriber sees only new predictions..." << std::endl;

    RecordingEngine engine;
    engine.setPrediction(scripted("next", 0.9f));
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    for (int i = 1; i <= 3; ++i) {
        source.emit(makeEvent("tap", i, "alice"));
    }
    assert(container.getTelemetrySnapshot().predictions_published == 3);

    auto late = container.subscribePredictions();
    assert(late->pending() == 0);

    source.emit(makeEvent("tap", 4, "alice"));
    assert(late->pending() == 1);
    auto next = late->tryNext();
    assert(next.has_value());
    assert(next->has_value());
    assert((*next)->suggestion == "next");
    assert(!late->tryNext().has_value());

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_get_prediction_is_published() {
    std::cout << "Testing pull prediction is broadcast too..." << std::endl;

    RecordingEngine engine;
    engine.setPrediction(scripted("compose", 0.8f));
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    auto subscription = container.subscribePredictions();
    auto pulled = container.getPrediction();
    assert(pulled.has_value());

    auto pushed = subscription->tryNext();
    assert(pushed.has_value());
    assert(*pushed == pulled);

    engine.failPredict = true;
    assert(!container.getPrediction().has_value());
    auto absent = subscription->tryNext();
    assert(absent.has_value());
    assert(!absent->has_value());
    assert(container.getTelemetrySnapshot().prediction_failures == 1);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_min_confidence_instruction() {
    std::cout << "Testing min confidence instruction..." << std::endl;

    RecordingEngine engine;
    engine.setPrediction(scripted("maybe", 0.4f));
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {MinConfidence{0.5f}},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    assert(!container.getPrediction().has_value());

    container.updateInstructions({MinConfidence{0.3f}});
    auto prediction = container.getPrediction();
    assert(prediction.has_value());
    assert(prediction->suggestion == "maybe");

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_event_failure_does_not_stop_pipeline() {
    std::cout << "Testing per-event failure publishes absent prediction..." << std::endl;

    RecordingEngine engine;
    engine.setPrediction(scripted("next", 0.9f));
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();
    auto subscription = container.subscribePredictions();

    storage.failSaveInteraction = true;
    source.emit(makeEvent("tap", 1, "alice"));

    auto absent = subscription->tryNext();
    assert(absent.has_value());
    assert(!absent->has_value());
    assert(engine.trainCalls == 0);

    storage.failSaveInteraction = false;
    source.emit(makeEvent("tap", 2, "alice"));
    assert(storage.interactionCount("alice") == 1);
    auto present = subscription->tryNext();
    assert(present.has_value() && present->has_value());

    auto telemetry = container.getTelemetrySnapshot();
    assert(telemetry.failed == 1);
    assert(telemetry.stored == 1);
    assert(telemetry.absent_predictions == 1);
    assert(container.lifecycle() == ContainerLifecycle::READY);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_observation_failure_is_isolated() {
    std::cout << "Testing observation failure keeps container ready..." << std::endl;

    RecordingEngine engine;
    engine.setPrediction(scripted("next", 0.9f));
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());
    container.initialize();

    source.emit(makeEvent("tap", 1, "alice"));
    source.fail("socket closed");

    auto telemetry = container.getTelemetrySnapshot();
    assert(telemetry.observation_failures == 1);
    assert(telemetry.state == PipelineState::FAILED);
    assert(container.lifecycle() == ContainerLifecycle::READY);
    assert(container.getPrediction().has_value());

    // Csak a reset indítja újra az observationt
    container.reset().get();
    telemetry = container.getTelemetrySnapshot();
    assert(source.observeCount() == 2);
    assert(telemetry.state == PipelineState::OBSERVING);
    assert(telemetry.observation_restarts == 1);

    source.emit(makeEvent("tap", 2, "alice"));
    assert(storage.interactionCount("alice") == 1);
    assert(container.getTelemetrySnapshot().stored == 2);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_unavailable_source_stays_failed() {
    std::cout << "Testing source that ends inside observe()..." << std::endl;

    RecordingEngine engine;
    FaultyStorage storage;
    ScriptedSource source;
    source.errorOnObserve = true;
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_current_thread(), quietConfig());

    container.initialize();
    auto telemetry = container.getTelemetrySnapshot();
    assert(container.lifecycle() == ContainerLifecycle::READY);
    assert(telemetry.state == PipelineState::FAILED);
    assert(telemetry.observation_failures == 1);

    // Sikertelen újraindítás nem számít restartnak
    container.reset().get();
    telemetry = container.getTelemetrySnapshot();
    assert(source.observeCalls == 2);
    assert(telemetry.state == PipelineState::FAILED);
    assert(telemetry.observation_failures == 2);
    assert(telemetry.observation_restarts == 0);

    source.errorOnObserve = false;
    container.reset().get();
    telemetry = container.getTelemetrySnapshot();
    assert(telemetry.state == PipelineState::OBSERVING);
    assert(telemetry.observation_restarts == 1);

    source.emit(makeEvent("tap", 1, "alice"));
    assert(storage.interactionCount("alice") == 1);

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_slow_subscriber_does_not_stall_pipeline() {
    std::cout << "Testing slow and idle subscribers on an event loop..." << std::endl;

    RecordingEngine engine;
    engine.setPrediction(scripted("next", 0.8f));
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    auto config = quietConfig();
    config.pipelineWorkers = 4;
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_event_loop(), config);
    container.initialize();

    auto slow = container.subscribePredictions(2);
    auto idle = container.subscribePredictions(2);

    std::atomic<bool> stop{false};
    std::atomic<int> consumed{0};
    std::thread consumer([&] {
        while (!stop) {
            if (slow->waitNext(std::chrono::milliseconds(20))) {
                consumed++;
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }
    });

    const int total = 10;
    for (int i = 0; i < total; ++i) {
        source.emit(makeEvent("tap", i + 1, "alice"));
    }

    // 10 x 200 ms fogyasztás mellett is gyorsan lefut
    assert(waitUntil([&] {
        auto t = container.getTelemetrySnapshot();
        return t.stored == total && t.predictions_published == total;
    }, std::chrono::milliseconds(1000)));

    assert(waitUntil([&] { return idle->received() == total; }));
    assert(idle->pending() == 2);
    assert(idle->dropped() == total - 2);
    assert(consumed < total);

    stop = true;
    consumer.join();

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_reset_discards_events_queued_before_it() {
    std::cout << "Testing reset on an event loop drops pre-reset events..." << std::endl;

    RecordingEngine engine;
    engine.setPrediction(scripted("next", 0.8f));
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);
    auto config = quietConfig();
    config.pipelineWorkers = 4;
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_event_loop(), config);
    container.initialize();

    std::thread producer([&] {
        for (int i = 0; i < 500; ++i) {
            source.emit(makeEvent("before", i + 1, "alice"));
        }
    });
    producer.join();

    container.reset().get();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    assert(storage.loadRecent("alice", 1000, std::string("before")).empty());
    for (const auto& type : engine.trainedTypes()) {
        assert(type != "before");
    }

    for (int i = 0; i < 5; ++i) {
        source.emit(makeEvent("after", 1000 + i, "alice"));
    }
    assert(waitUntil([&] {
        return storage.loadRecent("alice", 1000, std::string("after")).size() == 5;
    }));
    assert(storage.loadRecent("alice", 1000, std::string("before")).empty());

    container.release();
    std::cout << "  PASS" << std::endl;
}

void test_lifecycle_operations_are_mutually_exclusive() {
    std::cout << "Testing lifecycle mutual exclusion under load..." << std::endl;

    CriticalSectionCounter monitor;
    RecordingEngine engine;
    engine.monitor = &monitor;
    engine.setPrediction(scripted("next", 0.7f));
    FaultyStorage storage;
    storage.monitor = &monitor;
    Modules::SubjectDataSource source(LogLevel::SILENT);

    ContainerConfig config = quietConfig();
    config.pipelineWorkers = 4;
    Container container("alice", engine, storage, source, {},
                        rxcpp::schedulers::make_event_loop(), config);
    container.initialize();

    std::atomic<bool> stopEmitting{false};
    std::thread emitter([&] {
        int64_t ts = 0;
        while (!stopEmitting) {
            source.emit(makeEvent(ts % 2 == 0 ? "open" : "close", ++ts, "alice"));
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    });

    std::atomic<int> completed{0};
    std::vector<std::thread> callers;
    for (int t = 0; t < 4; ++t) {
        callers.emplace_back([&, t] {
            for (int i = 0; i < 10; ++i) {
                try {
                    if ((i + t) % 2 == 0) {
                        container.saveState().get();
                    } else {
                        container.reset().get();
                    }
                    completed++;
                } catch (const LifecycleError&) {
                    return;
                }
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    container.release();

    for (auto& caller : callers) caller.join();
    stopEmitting = true;
    emitter.join();

    assert(monitor.peak.load() == 1);
    assert(monitor.active.load() == 0);
    assert(completed.load() > 0);
    assert(engine.releaseCalls == 1);
    assert(storage.releaseCount() == 1);
    assert(container.lifecycle() == ContainerLifecycle::RELEASED);
    assert(container.getTelemetrySnapshot().in_flight_current == 0);

    std::cout << "  PASS" << std::endl;
}

void test_builder_validation() {
    std::cout << "Testing builder validation..." << std::endl;

    auto rejects = [](const std::string& id) {
        try {
            (void)ContainerBuilder::forUser(id);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };
    assert(rejects(""));
    assert(rejects("   \t"));
    assert(rejects(std::string(256, 'u')));
    assert(!rejects(std::string(255, 'u')));

    RecordingEngine engine;
    FaultyStorage storage;
    Modules::SubjectDataSource source(LogLevel::SILENT);

    bool missingSource = false;
    try {
        (void)ContainerBuilder::forUser("carol")
            .withLearningEngine(engine)
            .withDataStorage(storage)
            .withScheduler(rxcpp::schedulers::make_current_thread())
            .build();
    } catch (const std::logic_error& e) {
        missingSource = std::string(e.what()).find("DataSource") != std::string::npos;
    }
    assert(missingSource);

    auto container = ContainerBuilder::forUser("carol")
        .withLearningEngine(engine)
        .withDataStorage(storage)
        .withDataSource(source)
        .withInstructions({IgnoreEventType{"noise"}})
        .withScheduler(rxcpp::schedulers::make_current_thread())
        .withLogLevel(LogLevel::SILENT)
        .build();
    assert(container->getUserId() == "carol");
    assert(container->instructions()->size() == 1);
    assert(container->lifecycle() == ContainerLifecycle::UNINITIALIZED);

    ContainerConfig broken = quietConfig();
    broken.pipelineWorkers = 0;
    bool rejectedConfig = false;
    try {
        Container invalid("carol", engine, storage, source, {},
                          rxcpp::schedulers::make_current_thread(), broken);
    } catch (const std::invalid_argument&) {
        rejectedConfig = true;
    }
    assert(rejectedConfig);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Container Tests ===" << std::endl;

    test_initialize_with_empty_storage();
    test_initialize_twice_is_rejected();
    test_failed_initialize_can_be_retried();
    test_engine_failure_during_initialize();
    test_failed_observe_rolls_back_collaborators();
    test_invalid_transitions();
    test_reset_clears_learning_and_history();
    test_failed_reset_keeps_container_ready();
    test_ignored_events_are_never_stored();
    test_instruction_update_applies_to_later_events();
    test_saved_state_is_restored_exactly();
    test_frequency_engine_survives_restart();
    test_release_is_idempotent();
    test_release_reports_first_error_and_finishes();
    test_subscribers_see_no_replay();
    test_get_prediction_is_published();
    test_min_confidence_instruction();
    test_event_failure_does_not_stop_pipeline();
    test_observation_failure_is_isolated();
    test_unavailable_source_stays_failed();
    test_slow_subscriber_does_not_stall_pipeline();
    test_reset_discards_events_queued_before_it();
    test_lifecycle_operations_are_mutually_exclusive();
    test_builder_validation();

    std::cout << "\nAll container tests passed!" << std::endl;
    return 0;
}
