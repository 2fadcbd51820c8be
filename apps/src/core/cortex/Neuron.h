#pragma once

#include "Actor.h"
#include "core/genotype/ActivationFunction.h"

#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

namespace NeuroEvo {
namespace Cortex {

/**
 * Fires once per cycle, after exactly one signal from every predecessor.
 *
 * Each predecessor's weighted contribution is stored in its own slot and the
 * slots are summed in declared order, so arrival order never changes the
 * output. A second signal from a predecessor that already reported this cycle
 * belongs to the next cycle and is held back until this one fires.
 */
class Neuron : public Actor {
public:
    Neuron(
        NodeId id,
        NodeId synchronizerId,
        const ChannelTable& channels,
        ActivationFunction activation,
        std::vector<WeightedInput> inputs,
        double bias,
        std::vector<NodeId> outputs);

    const char* kind() const override { return "Neuron"; }

protected:
    void receiveLoop(Mailbox& mailbox) override;

private:
    void onForward(Forward forward);
    void fire();

    ActivationFn activation_;
    std::vector<WeightedInput> inputs_;
    double bias_;
    std::vector<NodeId> outputs_;

    std::unordered_map<NodeId, size_t> inputIndex_;
    std::vector<std::optional<double>> contributions_;
    size_t received_ = 0;
    std::deque<Forward> deferred_;
};

} // namespace Cortex
} // namespace NeuroEvo
