#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include "rxcpp/rx.hpp"

#include "core/ContainerBuilder.hpp"
#include "modules/FrequencyLearningEngine.hpp"
#include "modules/InMemoryDataStorage.hpp"
#include "modules/SubjectDataSource.hpp"

using namespace Adaptive;

namespace {

    Core::InteractionEvent makeEvent(const std::string& type, const std::string& userId, int64_t timestamp) {
        Core::InteractionEvent event;
        event.type = type;
        event.attributes = {{"source", "demo"}};
        event.timestamp = timestamp;
        event.userId = userId;
        return event;
    }

    void printPrediction(const Core::PredictionResult& prediction) {
        if (!prediction) {
            std::cout << "  -> (nincs predikció)" << std::endl;
            return;
        }
        std::cout << "  -> " << prediction->suggestion
                  << " (confidence=" << prediction->confidence
                  << ", category=" << prediction->category << ")" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    Core::LogLevel level = Core::LogLevel::LIFECYCLE_ONLY;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--quiet") {
            level = Core::LogLevel::SILENT;
        } else if (arg == "--debug") {
            level = Core::LogLevel::DEBUG;
        }
    }

    std::cout << "--- ADAPTIVE LEARNING CONTAINER - DEMO SESSION ---" << std::endl;

    const std::string userId = "demo-user";
    Modules::FrequencyLearningEngine engine(level);
    Modules::InMemoryDataStorage storage(level);
    Modules::SubjectDataSource source(level);

    auto container = Core::ContainerBuilder::forUser(userId)
        .withLearningEngine(engine)
        .withDataStorage(storage)
        .withDataSource(source)
        .withInstructions({Core::IgnoreEventType{"heartbeat"}})
        .withScheduler(rxcpp::schedulers::make_current_thread())
        .withLogLevel(level)
        .build();

    auto subscription = container->subscribePredictions();

    try {
        container->initialize();
    } catch (const Core::InitializationError& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    // 1.0 - Szintetikus munkamenet: edit -> build -> test ismétlődik
    const std::vector<std::string> session = {
        "git_status", "edit", "heartbeat", "build", "test", "edit", "build", "test",
        "heartbeat", "edit", "build", "test", "git_commit"
    };
    int64_t timestamp = 1;
    for (const auto& type : session) {
        source.emit(makeEvent(type, userId, timestamp++));
    }

    std::cout << "\n[1.0] Pipeline predikciók:" << std::endl;
    while (auto next = subscription->tryNext()) {
        printPrediction(*next);
    }

    // 2.0 - Pull alapú lekérdezés
    source.emit(makeEvent("edit", userId, timestamp++));
    std::cout << "\n[2.0] getPrediction() 'edit' után:" << std::endl;
    printPrediction(container->getPrediction());

    // 3.0 - Mentés
    try {
        container->saveState().get();
    } catch (const Core::ContainerError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    auto insights = container->getLearningInsights();
    auto snap = container->getTelemetrySnapshot();
    std::cout << "\n[3.0] Insights: " << insights.interactionCount << " interakció, érettség "
              << insights.progressEstimate << std::endl;
    std::cout << "[3.0] Telemetry: received=" << snap.received << " ignored=" << snap.ignored
              << " stored=" << snap.stored << " failed=" << snap.failed
              << " published=" << snap.predictions_published
              << " state=" << Core::pipelineStateName(snap.state) << std::endl;

    container->release();

    std::cout << "\n[SUCCESS] Session finished." << std::endl;
    return 0;
}
