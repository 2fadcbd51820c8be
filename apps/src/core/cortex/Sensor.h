#pragma once

#include "Actor.h"
#include "InterfaceRegistry.h"

#include <vector>

namespace NeuroEvo {
namespace Cortex {

class Sensor : public Actor {
public:
    Sensor(
        NodeId id,
        NodeId synchronizerId,
        const ChannelTable& channels,
        std::string name,
        int vectorLength,
        SensorFunction signal,
        std::vector<NodeId> fanOut);

    const char* kind() const override { return "Sensor"; }

protected:
    void receiveLoop(Mailbox& mailbox) override;

private:
    void sample();

    std::string name_;
    int vectorLength_;
    SensorFunction signal_;
    std::vector<NodeId> fanOut_;
};

} // namespace Cortex
} // namespace NeuroEvo
