#pragma once

#include "Message.h"

#include <optional>
#include <string>
#include <vector>

namespace NeuroEvo {
namespace Cortex {

enum class SynchronizerPhase { AwaitingInitialState, Running, CollectingBackup, Terminated };

inline const char* toString(SynchronizerPhase phase)
{
    switch (phase) {
        case SynchronizerPhase::AwaitingInitialState:
            return "AwaitingInitialState";
        case SynchronizerPhase::Running:
            return "Running";
        case SynchronizerPhase::CollectingBackup:
            return "CollectingBackup";
        case SynchronizerPhase::Terminated:
            return "Terminated";
    }
    return "Unknown";
}

struct RunResult {
    int stepsRequested = 0;
    int cyclesCompleted = 0;
    int sensorTriggers = 0;
    bool terminatedEarly = false;
    std::vector<SynchronizerPhase> phaseTrace;
    std::vector<NeuronBackup> backup; // Empty when the run failed.
    std::optional<std::string> failure;

    bool succeeded() const { return !failure.has_value(); }
};

} // namespace Cortex
} // namespace NeuroEvo
