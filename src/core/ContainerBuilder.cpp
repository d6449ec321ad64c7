// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#include "core/ContainerBuilder.hpp"
#include "utils/ConfigDefaults.hpp"
#include "utils/StringUtils.hpp"
#include <stdexcept>

namespace Adaptive::Core {

    ContainerBuilder::ContainerBuilder(std::string userId) : userId(std::move(userId)) {}

    ContainerBuilder ContainerBuilder::forUser(const std::string& userId) {
        if (AdaptiveUtils::isBlank(userId)) {
            throw std::invalid_argument("User ID cannot be blank. Provide a valid, persistent user identifier.");
        }
        if (userId.size() > AdaptiveDefaults::MAX_USER_ID_LENGTH) {
            throw std::invalid_argument("User ID must be " + std::to_string(AdaptiveDefaults::MAX_USER_ID_LENGTH)
                                        + " characters or less.");
        }
        return ContainerBuilder(userId);
    }

    ContainerBuilder& ContainerBuilder::withLearningEngine(LearningEngine& engine) {
        this->engine = &engine;
        return *this;
    }

    ContainerBuilder& ContainerBuilder::withDataStorage(DataStorage& storage) {
        this->storage = &storage;
        return *this;
    }

    ContainerBuilder& ContainerBuilder::withDataSource(DataSource& source) {
        this->source = &source;
        return *this;
    }

    ContainerBuilder& ContainerBuilder::withInstructions(InstructionList instructions) {
        this->instructions = std::move(instructions);
        return *this;
    }

    ContainerBuilder& ContainerBuilder::withScheduler(rxcpp::schedulers::scheduler scheduler) {
        this->scheduler = std::move(scheduler);
        return *this;
    }

    ContainerBuilder& ContainerBuilder::withConfig(const ContainerConfig& config) {
        this->config = config;
        return *this;
    }

    ContainerBuilder& ContainerBuilder::withLogLevel(LogLevel level) {
        config.logLevel = level;
        return *this;
    }

    std::unique_ptr<Container> ContainerBuilder::build() const {
        if (!engine) {
            throw std::logic_error("LearningEngine must be provided using withLearningEngine().");
        }
        if (!storage) {
            throw std::logic_error("DataStorage must be provided using withDataStorage().");
        }
        if (!source) {
            throw std::logic_error("DataSource must be provided using withDataSource().");
        }
        if (!scheduler) {
            throw std::logic_error("Scheduler must be provided using withScheduler().");
        }

        return std::make_unique<Container>(userId, *engine, *storage, *source, instructions, *scheduler, config);
    }
}
