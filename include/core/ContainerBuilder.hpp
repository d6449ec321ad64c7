// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#ifndef ADAPTIVE_CONTAINER_BUILDER_HPP
#define ADAPTIVE_CONTAINER_BUILDER_HPP

#include <memory>
#include <optional>
#include <string>
#include "rxcpp/rx.hpp"

#include "core/Container.hpp"

namespace Adaptive::Core {

    /**
     * @brief Fluent összerakó a Containerhez.
     * A collaboratorok nem birtokoltak: a hívónak kell túlélnie a konténert.
     */
    class ContainerBuilder {
    public:
        // std::invalid_argument: üres vagy túl hosszú azonosító
        static ContainerBuilder forUser(const std::string& userId);

        ContainerBuilder& withLearningEngine(LearningEngine& engine);
        ContainerBuilder& withDataStorage(DataStorage& storage);
        ContainerBuilder& withDataSource(DataSource& source);
        ContainerBuilder& withInstructions(InstructionList instructions);
        ContainerBuilder& withScheduler(rxcpp::schedulers::scheduler scheduler);
        ContainerBuilder& withConfig(const ContainerConfig& config);
        ContainerBuilder& withLogLevel(LogLevel level);

        // std::logic_error a hiányzó collaborator nevével
        [[nodiscard]] std::unique_ptr<Container> build() const;

    private:
        explicit ContainerBuilder(std::string userId);

        std::string userId;
        LearningEngine* engine = nullptr;
        DataStorage* storage = nullptr;
        DataSource* source = nullptr;
        InstructionList instructions;
        std::optional<rxcpp::schedulers::scheduler> scheduler;
        ContainerConfig config;
    };
}

#endif
