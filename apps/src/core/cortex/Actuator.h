#pragma once

#include "Actor.h"
#include "InterfaceRegistry.h"

#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

namespace NeuroEvo {
namespace Cortex {

// Gathers one signal per fan-in neuron, hands the vector to its consumer in
// fan-in order, then reports Sync.
class Actuator : public Actor {
public:
    Actuator(
        NodeId id,
        NodeId synchronizerId,
        const ChannelTable& channels,
        std::string name,
        int vectorLength,
        ActuatorFunction consume,
        std::vector<NodeId> fanIn);

    const char* kind() const override { return "Actuator"; }

protected:
    void receiveLoop(Mailbox& mailbox) override;

private:
    void onForward(Forward forward);
    void act();

    std::string name_;
    int vectorLength_;
    ActuatorFunction consume_;
    std::vector<NodeId> fanIn_;

    std::unordered_map<NodeId, size_t> fanInIndex_;
    std::vector<std::optional<std::vector<double>>> signals_;
    size_t received_ = 0;
    std::deque<Forward> deferred_;
};

} // namespace Cortex
} // namespace NeuroEvo
