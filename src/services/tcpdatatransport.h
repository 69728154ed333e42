/**
 * @file tcpdatatransport.h
 * @brief Data connections over TCP, optionally protected with TLS.
 */

#ifndef TCPDATATRANSPORT_H
#define TCPDATATRANSPORT_H

#include <QSslConfiguration>
#include <QTcpSocket>

#include <memory>
#include <optional>

#include "idatatransport.h"
#include "utils/enginesettings.h"

/**
 * @brief Data connection on a connected QTcpSocket (or QSslSocket).
 *
 * Uses the blocking socket API, so it must be used from the thread that
 * created it and needs no event loop.
 */
class TcpDataConnection : public IDataConnection
{
public:
    /// Grace period for an orderly shutdown before the socket is aborted
    static constexpr int CloseTimeoutMs = 1000;

    /**
     * @brief Takes ownership of a connected socket.
     * @param socket Connected (and, if required, encrypted) socket.
     * @param idleTimeoutMs Max time a single read or write may block.
     * @param bufferSize Bytes per chunk.
     */
    TcpDataConnection(std::unique_ptr<QTcpSocket> socket, int idleTimeoutMs, int bufferSize);

    /**
     * @brief Destructor. Closes the socket if still open.
     */
    ~TcpDataConnection() override;

    TransferOutcome transferToClient(QIODevice &source) override;
    TransferOutcome transferFromClient(QIODevice &sink, TransferType type) override;
    bool close() override;

    /**
     * @brief Decides whether a socket that stopped delivering data ended the upload.
     *
     * Qt reports a peer reset the same way as an orderly close
     * (RemoteHostClosedError), so both count as end of file. A socket still
     * connected (idle timeout) or any other error is an abort.
     */
    [[nodiscard]] static bool isEndOfUpload(QAbstractSocket::SocketState state,
                                            QAbstractSocket::SocketError error);

private:
    [[nodiscard]] bool flush();

    std::unique_ptr<QTcpSocket> socket_;
    int idleTimeoutMs_;
    int bufferSize_;
};

/**
 * @brief Production transport for active and passive data connections.
 *
 * @par Example usage:
 * @code
 * TcpDataTransport transport(settings);
 * auto descriptor = transport.createPassiveDescriptor();
 * if (descriptor) {
 *     session.setDataDescriptor(*descriptor);
 *     // reply 227 with descriptor->toHostPortString()
 * }
 * @endcode
 */
class TcpDataTransport : public IDataTransport
{
public:
    explicit TcpDataTransport(const EngineSettings &settings = EngineSettings());

    std::unique_ptr<IDataConnection> open(const DataConnectionDescriptor &descriptor,
                                          QString *errorString = nullptr) override;

    /**
     * @brief Starts listening for a passive-mode data connection.
     * @param secure True if the connection must be TLS protected.
     * @return A passive descriptor, or nullopt if no port could be bound.
     */
    [[nodiscard]] std::optional<DataConnectionDescriptor> createPassiveDescriptor(bool secure = false);

    /**
     * @brief Sets the certificate and key used for protected data connections.
     */
    void setSslConfiguration(const QSslConfiguration &configuration);

    /**
     * @brief Checks whether protected data connections can be opened.
     */
    [[nodiscard]] bool canEncrypt() const;

private:
    [[nodiscard]] std::unique_ptr<QTcpSocket> createSocket(bool secure) const;
    [[nodiscard]] bool startEncryption(QTcpSocket &socket, QString *errorString) const;

    EngineSettings settings_;
    std::optional<QSslConfiguration> sslConfiguration_;
};

#endif // TCPDATATRANSPORT_H
