#include "Sensor.h"
#include "core/LoggingChannels.h"

#include <stdexcept>

namespace NeuroEvo {
namespace Cortex {

Sensor::Sensor(
    NodeId id,
    NodeId synchronizerId,
    const ChannelTable& channels,
    std::string name,
    int vectorLength,
    SensorFunction signal,
    std::vector<NodeId> fanOut)
    : Actor(id, synchronizerId, channels),
      name_(std::move(name)),
      vectorLength_(vectorLength),
      signal_(std::move(signal)),
      fanOut_(std::move(fanOut))
{}

void Sensor::receiveLoop(Mailbox& mailbox)
{
    while (true) {
        Message message = mailbox.pop();
        if (std::holds_alternative<Terminate>(message)) {
            return;
        }
        if (std::holds_alternative<Sample>(message)) {
            sample();
        }
        else {
            LOG_WARN(Cortex, "Sensor {} ignoring {}", name_, getMessageName(message));
        }
    }
}

void Sensor::sample()
{
    std::vector<double> signal = signal_();
    if (static_cast<int>(signal.size()) != vectorLength_) {
        throw std::runtime_error(
            "sensor " + name_ + " produced " + std::to_string(signal.size())
            + " values, expected " + std::to_string(vectorLength_));
    }

    LOG_TRACE(Cortex, "Sensor {} sampled {} values", name_, signal.size());
    for (const NodeId target : fanOut_) {
        send(target, Forward{ .from = id_, .signal = signal });
    }
}

} // namespace Cortex
} // namespace NeuroEvo
