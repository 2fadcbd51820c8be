#pragma once

#include "core/genotype/GenotypeIds.h"

#include <string>
#include <variant>
#include <vector>

namespace NeuroEvo {
namespace Cortex {

// Weights a neuron applies to one predecessor's output vector.
struct WeightedInput {
    NodeId sourceId;
    std::vector<double> weights;

    bool operator==(const WeightedInput&) const = default;
};

struct NeuronBackup {
    NodeId neuronId;
    std::vector<WeightedInput> inputs;
    double bias = 0.0;

    bool operator==(const NeuronBackup&) const = default;
};

struct Start {
    int steps = 1;
    static constexpr const char* name() { return "Start"; }
};

struct Sample {
    static constexpr const char* name() { return "Sample"; }
};

struct Forward {
    NodeId from;
    std::vector<double> signal;
    static constexpr const char* name() { return "Forward"; }
};

struct Sync {
    NodeId from;
    static constexpr const char* name() { return "Sync"; }
};

struct GetBackup {
    static constexpr const char* name() { return "GetBackup"; }
};

struct Backup {
    NeuronBackup backup;
    static constexpr const char* name() { return "Backup"; }
};

struct Terminate {
    static constexpr const char* name() { return "Terminate"; }
};

struct ActorFailed {
    NodeId from;
    std::string error;
    static constexpr const char* name() { return "ActorFailed"; }
};

using Message =
    std::variant<Start, Sample, Forward, Sync, GetBackup, Backup, Terminate, ActorFailed>;

inline std::string getMessageName(const Message& message)
{
    return std::visit([](const auto& m) { return std::string(m.name()); }, message);
}

} // namespace Cortex
} // namespace NeuroEvo
