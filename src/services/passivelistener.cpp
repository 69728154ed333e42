#include "passivelistener.h"

#include <QDebug>
#include <QTcpSocket>

PassiveListener::PassiveListener(QObject *parent)
    : QTcpServer(parent)
{
    setMaxPendingConnections(1);
}

PassiveListener::~PassiveListener()
{
    while (!pending_.isEmpty()) {
        QTcpSocket orphan;
        if (orphan.setSocketDescriptor(pending_.dequeue())) {
            orphan.abort();
        }
    }
    close();
}

bool PassiveListener::listenInRange(const QHostAddress &address, quint16 portMin, quint16 portMax)
{
    if (portMin == 0) {
        return listen(address, 0);
    }

    for (quint32 port = portMin; port <= portMax; ++port) {
        if (listen(address, static_cast<quint16>(port))) {
            return true;
        }
    }

    qWarning() << "PASV: No free port in range" << portMin << "-" << portMax << ":" << errorString();
    return false;
}

qintptr PassiveListener::takeConnection(int timeoutMs)
{
    if (pending_.isEmpty() && isListening()) {
        bool timedOut = false;
        if (!waitForNewConnection(timeoutMs, &timedOut)) {
            qDebug() << "PASV: No connection on port" << serverPort()
                     << (timedOut ? "(timed out)" : qPrintable(errorString()));
        }
    }

    if (pending_.isEmpty()) {
        return -1;
    }
    return pending_.dequeue();
}

void PassiveListener::incomingConnection(qintptr socketDescriptor)
{
    pending_.enqueue(socketDescriptor);
}
