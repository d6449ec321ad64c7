// © 2026 Beatrix Zselezny. All rights reserved.
// Adaptive Learning Container
// Instruction evaluation against incoming events and outgoing predictions

#ifndef INSTRUCTION_PROBE_HPP
#define INSTRUCTION_PROBE_HPP

#include <optional>
#include <string>
#include "ContainerTypes.hpp"

namespace Adaptive::Core {

    /**
     * @brief Az esemény sorsa a pipeline elején.
     */
    enum class EventVerdict {
        ACCEPT, // storage + tanítás + predikció
        IGNORE  // egy IgnoreEventType szabály illeszkedett
    };

    /**
     * @brief Könnyűsúlyú szabály-kiértékelő.
     * Nem tart állapotot; mindig a dispatch pillanatában rögzített snapshot-on dolgozik.
     */
    class InstructionProbe {
    public:
        static EventVerdict evaluate(const InteractionEvent& event, const InstructionList& instructions);

        /**
         * @brief A legszigorúbb MinConfidence küszöb, ha van ilyen szabály.
         */
        static std::optional<float> minConfidence(const InstructionList& instructions);

        /**
         * @brief A küszöb alatti predikciót "nincs predikció"-ra cseréli.
         */
        static PredictionResult applyThreshold(PredictionResult prediction, const InstructionList& instructions);

        static std::string describe(const Instruction& instruction);
    };

} // namespace Adaptive::Core

#endif // INSTRUCTION_PROBE_HPP
