#ifndef IREPLYCHANNEL_H
#define IREPLYCHANNEL_H

#include "ftpreply.h"

/**
 * @brief Destination of control-connection replies for one session.
 *
 * Replies are delivered in the order they are sent.
 */
class IReplyChannel
{
public:
    virtual ~IReplyChannel() = default;

    /**
     * @brief Sends a reply. Fire-and-forget.
     */
    virtual void send(const FtpReply &reply) = 0;
};

#endif // IREPLYCHANNEL_H
