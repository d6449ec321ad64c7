// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#include "modules/FrequencyLearningEngine.hpp"
#include "core/ContainerErrors.hpp"
#include "core/InstructionProbe.hpp"
#include "utils/ConfigDefaults.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>

namespace Adaptive::Modules {

    namespace {

        // Payload: "FQT1" | u64 count | str last | u32 contexts | { str from | u32 n | { str to | u64 count } }
        constexpr char MAGIC[4] = {'F', 'Q', 'T', '1'};

        void putU32(std::vector<uint8_t>& out, uint32_t value) {
            for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }

        void putU64(std::vector<uint8_t>& out, uint64_t value) {
            for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }

        void putString(std::vector<uint8_t>& out, const std::string& value) {
            putU32(out, static_cast<uint32_t>(value.size()));
            out.insert(out.end(), value.begin(), value.end());
        }

        class PayloadReader {
        public:
            explicit PayloadReader(const std::vector<uint8_t>& data) : data(data) {}

            uint32_t u32() {
                require(4);
                uint32_t value = 0;
                for (int i = 0; i < 4; ++i) value |= static_cast<uint32_t>(data[pos++]) << (8 * i);
                return value;
            }

            uint64_t u64() {
                require(8);
                uint64_t value = 0;
                for (int i = 0; i < 8; ++i) value |= static_cast<uint64_t>(data[pos++]) << (8 * i);
                return value;
            }

            std::string str() {
                uint32_t length = u32();
                require(length);
                std::string value(reinterpret_cast<const char*>(data.data() + pos), length);
                pos += length;
                return value;
            }

            void magic() {
                require(sizeof(MAGIC));
                if (std::memcmp(data.data() + pos, MAGIC, sizeof(MAGIC)) != 0) {
                    throw Core::EngineError("FrequencyTransition payload: bad magic");
                }
                pos += sizeof(MAGIC);
            }

            bool atEnd() const { return pos == data.size(); }

        private:
            void require(std::size_t bytes) const {
                if (data.size() - pos < bytes) {
                    throw Core::EngineError("FrequencyTransition payload truncated at byte " + std::to_string(pos));
                }
            }

            const std::vector<uint8_t>& data;
            std::size_t pos = 0;
        };
    }

    FrequencyLearningEngine::FrequencyLearningEngine(Core::LogLevel level) : currentLogLevel(level) {}

    FrequencyLearningEngine::~FrequencyLearningEngine() {
        if (initialized.load()) {
            release();
        }
    }

    void FrequencyLearningEngine::initialize(const std::optional<Core::ContainerState>& savedState,
                                             rxcpp::schedulers::scheduler scope) {
        if (initialized.load()) {
            if (currentLogLevel != Core::LogLevel::SILENT) {
                std::cout << "[FrequencyEngine] Already initialized." << std::endl;
            }
            return;
        }

        Model loaded;
        if (savedState) {
            try {
                loaded = deserialize(*savedState);
                if (currentLogLevel != Core::LogLevel::SILENT) {
                    std::cout << "[FrequencyEngine] State loaded: " << loaded.transitions.size()
                              << " contexts, " << loaded.interactionCount << " interactions." << std::endl;
                }
            } catch (const Core::EngineError& e) {
                // Sérült állapot: friss modellel indulunk, nem blokkoljuk a konténert
                std::cerr << "[FrequencyEngine][ERROR] Error loading state: " << e.what()
                          << ". Using initial model." << std::endl;
                loaded = Model{};
            }
        } else if (currentLogLevel != Core::LogLevel::SILENT) {
            std::cout << "[FrequencyEngine] No previous state found, using initial model." << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(modelMutex);
            model = std::move(loaded);
        }
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            trainingLifetime = rxcpp::composite_subscription();
            trainingWorker = scope.create_worker(trainingLifetime);
        }
        initialized = true;
    }

    Core::TaskHandle FrequencyLearningEngine::trainStep(const Core::InteractionEvent& event) {
        auto promise = std::make_shared<std::promise<void>>();
        Core::TaskHandle handle = promise->get_future().share();

        std::optional<rxcpp::schedulers::worker> worker;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            if (initialized.load() && trainingWorker) {
                worker = trainingWorker;
                pendingTraining++;
            }
        }

        if (!worker) {
            std::cerr << "[FrequencyEngine] WARN: trainStep called before initialization." << std::endl;
            promise->set_value();
            return handle;
        }

        worker->schedule([this, event, promise](const rxcpp::schedulers::schedulable&) {
            try {
                learn(event);
                promise->set_value();
            } catch (const std::exception& e) {
                std::cerr << "[FrequencyEngine][ERROR] trainStep failed: " << e.what() << std::endl;
                promise->set_exception(std::current_exception());
            }
            finishTraining();
        });

        return handle;
    }

    void FrequencyLearningEngine::learn(const Core::InteractionEvent& event) {
        std::lock_guard<std::mutex> lock(modelMutex);
        if (!model.lastType.empty()) {
            model.transitions[model.lastType][event.type]++;
        }
        model.lastType = event.type;
        model.interactionCount++;

        if (currentLogLevel == Core::LogLevel::DEBUG) {
            std::cout << "[FrequencyEngine] Trained on '" << event.type << "' ("
                      << model.interactionCount << " total)." << std::endl;
        }
    }

    Core::PredictionResult FrequencyLearningEngine::predict(const std::vector<Core::InteractionEvent>& recent,
                                                            const Core::InstructionList& instructions) {
        if (!initialized.load()) {
            std::cerr << "[FrequencyEngine] WARN: predict called before initialization." << std::endl;
            return std::nullopt;
        }
        if (recent.empty()) {
            return std::nullopt;
        }

        // recent: legfrissebb elöl
        const std::string& context = recent.front().type;

        Core::Prediction prediction;
        {
            std::lock_guard<std::mutex> lock(modelMutex);
            auto it = model.transitions.find(context);
            if (it == model.transitions.end() || it->second.empty()) {
                return std::nullopt;
            }

            uint64_t total = 0;
            const std::string* best = nullptr;
            uint64_t bestCount = 0;
            for (const auto& [next, count] : it->second) {
                total += count;
                if (count > bestCount) {
                    best = &next;
                    bestCount = count;
                }
            }

            if (best == nullptr || total == 0) {
                return std::nullopt;
            }

            prediction.suggestion = *best;
            prediction.confidence = static_cast<float>(bestCount) / static_cast<float>(total);
            prediction.category = PREDICTION_CATEGORY;
            prediction.metadata = {
                {"context", context},
                {"observations", std::to_string(total)}
            };
        }

        return Core::InstructionProbe::applyThreshold(std::move(prediction), instructions);
    }

    Core::ContainerState FrequencyLearningEngine::getCurrentState() {
        requireInitialized("getCurrentState");
        std::lock_guard<std::mutex> lock(modelMutex);
        return serialize(model.transitions, model.lastType, model.interactionCount);
    }

    void FrequencyLearningEngine::reset() {
        requireInitialized("reset");
        awaitTraining();
        std::lock_guard<std::mutex> lock(modelMutex);
        model = Model{};
        if (currentLogLevel != Core::LogLevel::SILENT) {
            std::cout << "[FrequencyEngine] Model reset to blank state." << std::endl;
        }
    }

    void FrequencyLearningEngine::release() {
        awaitTraining();
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            initialized = false;
            trainingWorker.reset();
            if (trainingLifetime.is_subscribed()) {
                trainingLifetime.unsubscribe();
            }
        }
        if (currentLogLevel != Core::LogLevel::SILENT) {
            std::cout << "[FrequencyEngine] Released." << std::endl;
        }
    }

    Core::LearningInsights FrequencyLearningEngine::getLearningInsights() {
        std::lock_guard<std::mutex> lock(modelMutex);
        Core::LearningInsights insights;
        insights.interactionCount = model.interactionCount;
        insights.progressEstimate = static_cast<float>(
            std::min(1.0, static_cast<double>(model.interactionCount) / AdaptiveDefaults::MATURITY_INTERACTIONS));
        insights.customMetrics["distinct_contexts"] = static_cast<double>(model.transitions.size());
        return insights;
    }

    void FrequencyLearningEngine::awaitTraining() {
        std::unique_lock<std::mutex> lock(pendingMutex);
        trainingDone.wait(lock, [this] { return pendingTraining == 0; });
    }

    void FrequencyLearningEngine::finishTraining() {
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            pendingTraining--;
        }
        trainingDone.notify_all();
    }

    void FrequencyLearningEngine::requireInitialized(const char* operation) const {
        if (!initialized.load()) {
            throw Core::EngineError(std::string("FrequencyLearningEngine::") + operation + " called before initialize()");
        }
    }

    Core::ContainerState FrequencyLearningEngine::serialize(const TransitionTable& table,
                                                            const std::string& lastType,
                                                            uint64_t interactionCount) {
        Core::ContainerState state;
        state.version = STATE_VERSION;

        auto& out = state.payload;
        out.insert(out.end(), std::begin(MAGIC), std::end(MAGIC));
        putU64(out, interactionCount);
        putString(out, lastType);
        putU32(out, static_cast<uint32_t>(table.size()));
        for (const auto& [from, successors] : table) {
            putString(out, from);
            putU32(out, static_cast<uint32_t>(successors.size()));
            for (const auto& [to, count] : successors) {
                putString(out, to);
                putU64(out, count);
            }
        }
        return state;
    }

    FrequencyLearningEngine::Model FrequencyLearningEngine::deserialize(const Core::ContainerState& state) {
        if (state.version != STATE_VERSION) {
            throw Core::EngineError("FrequencyTransition payload version " + std::to_string(state.version)
                                    + " is not supported");
        }

        PayloadReader reader(state.payload);
        reader.magic();

        Model result;
        result.interactionCount = reader.u64();
        result.lastType = reader.str();

        uint32_t contexts = reader.u32();
        for (uint32_t i = 0; i < contexts; ++i) {
            std::string from = reader.str();
            uint32_t successors = reader.u32();
            auto& row = result.transitions[from];
            for (uint32_t j = 0; j < successors; ++j) {
                std::string to = reader.str();
                uint64_t count = reader.u64();
                // learn() csak pozitív számlálót ír
                if (count == 0) {
                    throw Core::EngineError("FrequencyTransition payload has zero count for '"
                                            + from + "' -> '" + to + "'");
                }
                row[to] = count;
            }
        }

        if (!reader.atEnd()) {
            throw Core::EngineError("FrequencyTransition payload has trailing bytes");
        }
        return result;
    }

} // namespace Adaptive::Modules
