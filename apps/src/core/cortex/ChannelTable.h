#pragma once

#include "Message.h"
#include "core/SynchronizedQueue.h"

#include <memory>
#include <unordered_map>

namespace NeuroEvo {
namespace Cortex {

using Mailbox = SynchronizedQueue<Message>;

/**
 * Mailboxes of one network, keyed by node id. Filled while the network is
 * built and read-only once actor threads run, so lookups need no locking.
 */
class ChannelTable {
public:
    Mailbox& add(NodeId id);
    Mailbox* find(NodeId id) const;

    // Returns false when no actor owns `to`.
    bool send(NodeId to, Message message) const;

private:
    std::unordered_map<NodeId, std::unique_ptr<Mailbox>> mailboxes_;
};

inline Mailbox& ChannelTable::add(NodeId id)
{
    auto& slot = mailboxes_[id];
    if (!slot) {
        slot = std::make_unique<Mailbox>();
    }
    return *slot;
}

inline Mailbox* ChannelTable::find(NodeId id) const
{
    const auto it = mailboxes_.find(id);
    return it == mailboxes_.end() ? nullptr : it->second.get();
}

inline bool ChannelTable::send(NodeId to, Message message) const
{
    Mailbox* mailbox = find(to);
    if (!mailbox) {
        return false;
    }
    mailbox->push(std::move(message));
    return true;
}

} // namespace Cortex
} // namespace NeuroEvo
