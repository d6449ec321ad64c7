// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container

#include "core/InstructionProbe.hpp"
#include <algorithm>
#include <sstream>
#include <type_traits>

namespace Adaptive::Core {

    EventVerdict InstructionProbe::evaluate(const InteractionEvent& event, const InstructionList& instructions) {
        for (const auto& instruction : instructions) {
            const auto* ignore = std::get_if<IgnoreEventType>(&instruction);
            if (ignore && ignore->type == event.type) {
                return EventVerdict::IGNORE;
            }
        }
        return EventVerdict::ACCEPT;
    }

    std::optional<float> InstructionProbe::minConfidence(const InstructionList& instructions) {
        std::optional<float> strictest;
        for (const auto& instruction : instructions) {
            if (const auto* min = std::get_if<MinConfidence>(&instruction)) {
                strictest = strictest ? std::max(*strictest, min->threshold) : min->threshold;
            }
        }
        return strictest;
    }

    PredictionResult InstructionProbe::applyThreshold(PredictionResult prediction, const InstructionList& instructions) {
        if (!prediction) {
            return prediction;
        }
        auto threshold = minConfidence(instructions);
        if (threshold && prediction->confidence < *threshold) {
            return std::nullopt;
        }
        return prediction;
    }

    std::string InstructionProbe::describe(const Instruction& instruction) {
        return std::visit([](const auto& rule) -> std::string {
            using Rule = std::decay_t<decltype(rule)>;
            std::ostringstream out;
            if constexpr (std::is_same_v<Rule, IgnoreEventType>) {
                out << "IgnoreEventType(" << rule.type << ")";
            } else {
                out << "MinConfidence(" << rule.threshold << ")";
            }
            return out.str();
        }, instruction);
    }

} // namespace Adaptive::Core
