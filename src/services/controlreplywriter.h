/**
 * @file controlreplywriter.h
 * @brief Writes replies to the control connection.
 */

#ifndef CONTROLREPLYWRITER_H
#define CONTROLREPLYWRITER_H

#include <QPointer>

#include "ireplychannel.h"

class QIODevice;

/**
 * @brief Reply channel on top of the control connection device.
 *
 * Writes each reply in wire format and, for sockets, waits until it has
 * left the process so a 150 is on the wire before the data connection is
 * opened.
 */
class ControlReplyWriter : public IReplyChannel
{
public:
    /// Max time to wait for a reply to be written
    static constexpr int WriteTimeoutMs = 30000;

    /**
     * @brief Constructs a writer.
     * @param device Control connection, typically a QTcpSocket (not owned).
     */
    explicit ControlReplyWriter(QIODevice *device);

    void send(const FtpReply &reply) override;

private:
    QPointer<QIODevice> device_;
};

#endif // CONTROLREPLYWRITER_H
