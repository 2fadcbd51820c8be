#include "Neuron.h"
#include "core/LoggingChannels.h"

#include <stdexcept>

namespace NeuroEvo {
namespace Cortex {

Neuron::Neuron(
    NodeId id,
    NodeId synchronizerId,
    const ChannelTable& channels,
    ActivationFunction activation,
    std::vector<WeightedInput> inputs,
    double bias,
    std::vector<NodeId> outputs)
    : Actor(id, synchronizerId, channels),
      activation_(resolveActivation(activation)),
      inputs_(std::move(inputs)),
      bias_(bias),
      outputs_(std::move(outputs)),
      contributions_(inputs_.size())
{
    for (size_t i = 0; i < inputs_.size(); ++i) {
        inputIndex_[inputs_[i].sourceId] = i;
    }
}

void Neuron::receiveLoop(Mailbox& mailbox)
{
    while (true) {
        Message message = mailbox.pop();
        if (std::holds_alternative<Terminate>(message)) {
            return;
        }
        if (auto* forward = std::get_if<Forward>(&message)) {
            onForward(std::move(*forward));
        }
        else if (std::holds_alternative<GetBackup>(message)) {
            send(
                synchronizerId_,
                Backup{ .backup = { .neuronId = id_, .inputs = inputs_, .bias = bias_ } });
        }
        else {
            LOG_WARN(Cortex, "Neuron {} ignoring {}", id_, getMessageName(message));
        }
    }
}

void Neuron::onForward(Forward forward)
{
    const auto it = inputIndex_.find(forward.from);
    if (it == inputIndex_.end()) {
        throw std::runtime_error("unexpected signal from " + std::to_string(forward.from.get()));
    }

    const size_t slot = it->second;
    if (contributions_[slot].has_value()) {
        deferred_.push_back(std::move(forward));
        return;
    }

    const auto& weights = inputs_[slot].weights;
    if (forward.signal.size() != weights.size()) {
        throw std::runtime_error(
            "signal from " + std::to_string(forward.from.get()) + " has "
            + std::to_string(forward.signal.size()) + " values, expected "
            + std::to_string(weights.size()));
    }

    double dot = 0.0;
    for (size_t k = 0; k < weights.size(); ++k) {
        dot += forward.signal[k] * weights[k];
    }
    contributions_[slot] = dot;
    received_++;

    if (received_ < inputs_.size()) {
        return;
    }

    fire();

    std::deque<Forward> pending;
    pending.swap(deferred_);
    for (auto& next : pending) {
        onForward(std::move(next));
    }
}

void Neuron::fire()
{
    double accumulator = 0.0;
    for (auto& contribution : contributions_) {
        accumulator += contribution.value();
        contribution.reset();
    }
    received_ = 0;

    const double output = activation_(accumulator + bias_);
    LOG_TRACE(Cortex, "Neuron {} fired {}", id_, output);
    for (const NodeId target : outputs_) {
        send(target, Forward{ .from = id_, .signal = { output } });
    }
}

} // namespace Cortex
} // namespace NeuroEvo
