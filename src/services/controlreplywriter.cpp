#include "controlreplywriter.h"

#include <QAbstractSocket>
#include <QDebug>
#include <QIODevice>

ControlReplyWriter::ControlReplyWriter(QIODevice *device)
    : device_(device)
{
}

void ControlReplyWriter::send(const FtpReply &reply)
{
    if (!device_ || !device_->isWritable()) {
        qDebug() << "FTP: Cannot send reply, control connection closed:" << reply.code;
        return;
    }

    qDebug() << "FTP: >>" << reply.code << reply.text;
    const QByteArray wire = reply.toWireFormat();
    if (device_->write(wire) != wire.size()) {
        qWarning() << "FTP: Failed to write reply" << reply.code << ":" << device_->errorString();
        return;
    }

    if (auto *socket = qobject_cast<QAbstractSocket *>(device_.data())) {
        while (socket->bytesToWrite() > 0) {
            if (!socket->waitForBytesWritten(WriteTimeoutMs)) {
                qWarning() << "FTP: Reply" << reply.code << "not delivered:" << socket->errorString();
                return;
            }
        }
    }
}
