/**
 * @file passivelistener.h
 * @brief Listening socket backing a passive-mode data connection.
 */

#ifndef PASSIVELISTENER_H
#define PASSIVELISTENER_H

#include <QHostAddress>
#include <QQueue>
#include <QTcpServer>

/**
 * @brief QTcpServer that hands out raw socket descriptors.
 *
 * Accepted connections are kept as native descriptors so the transport can
 * wrap them in either a QTcpSocket or a QSslSocket. Designed for blocking use
 * from a session thread without an event loop.
 */
class PassiveListener : public QTcpServer
{
    Q_OBJECT

public:
    explicit PassiveListener(QObject *parent = nullptr);

    /**
     * @brief Destructor. Closes any accepted but unclaimed connection.
     */
    ~PassiveListener() override;

    /**
     * @brief Starts listening on the first free port of a range.
     * @param address Local address to bind.
     * @param portMin First port to try, 0 lets the system choose.
     * @param portMax Last port to try, ignored when portMin is 0.
     * @return True if listening.
     */
    bool listenInRange(const QHostAddress &address, quint16 portMin, quint16 portMax);

    /**
     * @brief Waits for the client to connect.
     * @param timeoutMs Maximum time to block.
     * @return The accepted native socket descriptor, or -1 on timeout or error.
     */
    [[nodiscard]] qintptr takeConnection(int timeoutMs);

protected:
    void incomingConnection(qintptr socketDescriptor) override;

private:
    QQueue<qintptr> pending_;
};

#endif // PASSIVELISTENER_H
