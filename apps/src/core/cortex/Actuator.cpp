#include "Actuator.h"
#include "core/LoggingChannels.h"

#include <stdexcept>

namespace NeuroEvo {
namespace Cortex {

Actuator::Actuator(
    NodeId id,
    NodeId synchronizerId,
    const ChannelTable& channels,
    std::string name,
    int vectorLength,
    ActuatorFunction consume,
    std::vector<NodeId> fanIn)
    : Actor(id, synchronizerId, channels),
      name_(std::move(name)),
      vectorLength_(vectorLength),
      consume_(std::move(consume)),
      fanIn_(std::move(fanIn)),
      signals_(fanIn_.size())
{
    for (size_t i = 0; i < fanIn_.size(); ++i) {
        fanInIndex_[fanIn_[i]] = i;
    }
}

void Actuator::receiveLoop(Mailbox& mailbox)
{
    while (true) {
        Message message = mailbox.pop();
        if (std::holds_alternative<Terminate>(message)) {
            return;
        }
        if (auto* forward = std::get_if<Forward>(&message)) {
            onForward(std::move(*forward));
        }
        else {
            LOG_WARN(Cortex, "Actuator {} ignoring {}", name_, getMessageName(message));
        }
    }
}

void Actuator::onForward(Forward forward)
{
    const auto it = fanInIndex_.find(forward.from);
    if (it == fanInIndex_.end()) {
        throw std::runtime_error(
            "actuator " + name_ + " got a signal from " + std::to_string(forward.from.get()));
    }

    const size_t slot = it->second;
    if (signals_[slot].has_value()) {
        deferred_.push_back(std::move(forward));
        return;
    }

    signals_[slot] = std::move(forward.signal);
    received_++;
    if (received_ < fanIn_.size()) {
        return;
    }

    act();

    std::deque<Forward> pending;
    pending.swap(deferred_);
    for (auto& next : pending) {
        onForward(std::move(next));
    }
}

void Actuator::act()
{
    std::vector<double> output;
    output.reserve(vectorLength_);
    for (auto& signal : signals_) {
        output.insert(output.end(), signal->begin(), signal->end());
        signal.reset();
    }
    received_ = 0;

    if (static_cast<int>(output.size()) != vectorLength_) {
        throw std::runtime_error(
            "actuator " + name_ + " assembled " + std::to_string(output.size())
            + " values, expected " + std::to_string(vectorLength_));
    }

    consume_(output);
    send(synchronizerId_, Sync{ .from = id_ });
}

} // namespace Cortex
} // namespace NeuroEvo
