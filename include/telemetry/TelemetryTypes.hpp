#pragma once

namespace Adaptive::Core {

// Az observation pipeline állapota (nem azonos a konténer lifecycle-jével)
enum class PipelineState {
    IDLE,       // még nem indult
    OBSERVING,
    DRAINING,   // reset/release: observation leállítva, in-flight taskok lefutnak
    STOPPED,
    FAILED      // a DataSource streamje hibával ért véget
};

inline const char* pipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::IDLE:      return "IDLE";
        case PipelineState::OBSERVING: return "OBSERVING";
        case PipelineState::DRAINING:  return "DRAINING";
        case PipelineState::STOPPED:   return "STOPPED";
        case PipelineState::FAILED:    return "FAILED";
    }
    return "UNKNOWN";
}

}
