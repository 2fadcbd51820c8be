#pragma once

#include "ChannelTable.h"

#include <string>

namespace NeuroEvo {
namespace Cortex {

/**
 * One node of a running network. Each actor owns a thread for the lifetime of
 * the network and talks to the others only through the channel table.
 */
class Actor {
public:
    Actor(NodeId id, NodeId synchronizerId, const ChannelTable& channels);
    virtual ~Actor() = default;

    Actor(const Actor&) = delete;
    Actor& operator=(const Actor&) = delete;

    NodeId id() const { return id_; }

    // Thread body. Returns after Terminate, or after reporting a failure.
    void run();

    virtual const char* kind() const = 0;

protected:
    virtual void receiveLoop(Mailbox& mailbox) = 0;

    // Called with the exception message when receiveLoop throws.
    virtual void onFailure(const std::string& error);

    // Throws std::runtime_error when `to` has no mailbox.
    void send(NodeId to, Message message) const;

    NodeId id_;
    NodeId synchronizerId_;
    const ChannelTable& channels_;
};

} // namespace Cortex
} // namespace NeuroEvo
