/**
 * @file idatatransport.h
 * @brief Interfaces for opening and using data connections.
 *
 * This interface allows dependency injection of the transport, enabling
 * tests to script connection failures without touching the network.
 */

#ifndef IDATATRANSPORT_H
#define IDATATRANSPORT_H

#include <QIODevice>
#include <QString>

#include <memory>

#include "dataconnectiondescriptor.h"
#include "transferoutcome.h"

/**
 * @brief Representation type negotiated with TYPE.
 */
enum class TransferType {
    Ascii,  ///< TYPE A, line endings are converted on upload
    Binary  ///< TYPE I, bytes are stored unchanged
};

/**
 * @brief A live, single-use data channel.
 *
 * Exactly one transfer is performed per connection. Both transfer methods
 * report socket-level aborts as TransferOutcome::Kind::ConnectionAborted and
 * local stream errors as TransferOutcome::Kind::IoFailure.
 */
class IDataConnection
{
public:
    virtual ~IDataConnection() = default;

    /**
     * @brief Sends everything readable from a device to the client.
     * @param source Device read until it returns no more data.
     * @return Success with the number of bytes sent, or the failure.
     */
    virtual TransferOutcome transferToClient(QIODevice &source) = 0;

    /**
     * @brief Receives from the client until it closes the connection.
     * @param sink Device the received bytes are written to.
     * @param type ASCII converts CRLF to LF before writing.
     * @return Success with the number of bytes received, or the failure.
     */
    virtual TransferOutcome transferFromClient(QIODevice &sink, TransferType type) = 0;

    /**
     * @brief Closes the connection. Safe to call more than once.
     * @return False if the connection could not be shut down cleanly.
     */
    virtual bool close() = 0;
};

/**
 * @brief Factory establishing data connections from descriptors.
 */
class IDataTransport
{
public:
    virtual ~IDataTransport() = default;

    /**
     * @brief Connects back (active) or accepts (passive) a data connection.
     * @param descriptor The session's negotiated descriptor.
     * @param errorString Receives a diagnostic on failure, may be null.
     * @return The open connection, or nullptr if it could not be established.
     */
    virtual std::unique_ptr<IDataConnection> open(const DataConnectionDescriptor &descriptor,
                                                  QString *errorString = nullptr) = 0;
};

#endif // IDATATRANSPORT_H
