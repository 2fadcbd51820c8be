#include "Actor.h"
#include "core/LoggingChannels.h"

#include <stdexcept>

namespace NeuroEvo {
namespace Cortex {

Actor::Actor(NodeId id, NodeId synchronizerId, const ChannelTable& channels)
    : id_(id), synchronizerId_(synchronizerId), channels_(channels)
{}

void Actor::run()
{
    Mailbox* mailbox = channels_.find(id_);
    if (!mailbox) {
        onFailure("no mailbox registered");
        return;
    }

    try {
        receiveLoop(*mailbox);
    }
    catch (const std::exception& e) {
        onFailure(e.what());
    }
}

void Actor::onFailure(const std::string& error)
{
    LOG_ERROR(Cortex, "{} {} failed: {}", kind(), id_, error);
    channels_.send(synchronizerId_, ActorFailed{ .from = id_, .error = error });
}

void Actor::send(NodeId to, Message message) const
{
    if (!channels_.send(to, std::move(message))) {
        throw std::runtime_error("no actor with id " + std::to_string(to.get()));
    }
}

} // namespace Cortex
} // namespace NeuroEvo
