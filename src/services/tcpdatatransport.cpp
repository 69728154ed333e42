#include "tcpdatatransport.h"
#include "passivelistener.h"
#include "utils/logging.h"

#include <QByteArray>
#include <QDebug>
#include <QSslSocket>

namespace {

// CRLF -> LF for TYPE A uploads. A trailing CR is held back until the next
// chunk shows whether it starts a line ending.
QByteArray toLocalLineEndings(const char *data, qint64 size, bool &pendingCr)
{
    QByteArray out;
    out.reserve(static_cast<int>(size) + 1);

    for (qint64 i = 0; i < size; ++i) {
        const char c = data[i];
        if (pendingCr) {
            pendingCr = false;
            if (c == '\n') {
                out.append('\n');
                continue;
            }
            out.append('\r');
        }
        if (c == '\r') {
            pendingCr = true;
            continue;
        }
        out.append(c);
    }
    return out;
}

bool writeAll(QIODevice &sink, const QByteArray &data)
{
    return data.isEmpty() || sink.write(data) == data.size();
}

} // namespace

TcpDataConnection::TcpDataConnection(std::unique_ptr<QTcpSocket> socket, int idleTimeoutMs,
                                     int bufferSize)
    : socket_(std::move(socket))
    , idleTimeoutMs_(idleTimeoutMs)
    , bufferSize_(bufferSize > 0 ? bufferSize : EngineSettings::DefaultBufferSize)
{
}

TcpDataConnection::~TcpDataConnection()
{
    close();
}

TransferOutcome TcpDataConnection::transferToClient(QIODevice &source)
{
    if (!socket_ || socket_->state() != QAbstractSocket::ConnectedState) {
        return TransferOutcome::connectionAborted(QStringLiteral("Data connection is not open"));
    }

    QByteArray buffer(bufferSize_, Qt::Uninitialized);
    qint64 total = 0;

    forever {
        const qint64 read = source.read(buffer.data(), buffer.size());
        if (read < 0 && !source.atEnd()) {
            return TransferOutcome::ioFailure(source.errorString()).withBytes(total);
        }
        if (read <= 0) {
            break;
        }

        qint64 written = 0;
        while (written < read) {
            const qint64 n = socket_->write(buffer.constData() + written, read - written);
            if (n < 0) {
                return TransferOutcome::connectionAborted(socket_->errorString()).withBytes(total);
            }
            written += n;
        }

        if (!flush()) {
            return TransferOutcome::connectionAborted(socket_->errorString()).withBytes(total);
        }

        total += read;
        LOG_VERBOSE() << "DATA: Sent" << read << "bytes, total" << total;
    }

    return TransferOutcome::success(total);
}

bool TcpDataConnection::isEndOfUpload(QAbstractSocket::SocketState state,
                                      QAbstractSocket::SocketError error)
{
    return state != QAbstractSocket::ConnectedState
           && (error == QAbstractSocket::RemoteHostClosedError
               || error == QAbstractSocket::UnknownSocketError);
}

TransferOutcome TcpDataConnection::transferFromClient(QIODevice &sink, TransferType type)
{
    if (!socket_) {
        return TransferOutcome::connectionAborted(QStringLiteral("Data connection is not open"));
    }

    QByteArray buffer(bufferSize_, Qt::Uninitialized);
    qint64 total = 0;
    bool pendingCr = false;

    forever {
        if (socket_->bytesAvailable() <= 0) {
            if (socket_->state() == QAbstractSocket::ConnectedState
                && socket_->waitForReadyRead(idleTimeoutMs_)) {
                continue;
            }
            if (socket_->bytesAvailable() > 0) {
                continue;
            }
            // The client signals end of file by closing the connection
            if (isEndOfUpload(socket_->state(), socket_->error())) {
                break;
            }
            return TransferOutcome::connectionAborted(socket_->errorString()).withBytes(total);
        }

        const qint64 read = socket_->read(buffer.data(), buffer.size());
        if (read < 0) {
            return TransferOutcome::connectionAborted(socket_->errorString()).withBytes(total);
        }

        const QByteArray chunk = type == TransferType::Ascii
                                     ? toLocalLineEndings(buffer.constData(), read, pendingCr)
                                     : QByteArray(buffer.constData(), static_cast<int>(read));
        if (!writeAll(sink, chunk)) {
            return TransferOutcome::ioFailure(sink.errorString()).withBytes(total);
        }

        total += read;
        LOG_VERBOSE() << "DATA: Received" << read << "bytes, total" << total;
    }

    if (pendingCr && !writeAll(sink, QByteArrayLiteral("\r"))) {
        return TransferOutcome::ioFailure(sink.errorString()).withBytes(total);
    }

    return TransferOutcome::success(total);
}

bool TcpDataConnection::close()
{
    if (!socket_) {
        return true;
    }

    bool clean = true;
    if (socket_->state() != QAbstractSocket::UnconnectedState) {
        socket_->disconnectFromHost();
        if (socket_->state() != QAbstractSocket::UnconnectedState
            && !socket_->waitForDisconnected(CloseTimeoutMs)) {
            qWarning() << "DATA: Data connection did not close cleanly:" << socket_->errorString();
            socket_->abort();
            clean = false;
        }
    }

    socket_.reset();
    return clean;
}

bool TcpDataConnection::flush()
{
    while (socket_->bytesToWrite() > 0) {
        if (!socket_->waitForBytesWritten(idleTimeoutMs_)) {
            return false;
        }
    }
    return true;
}

TcpDataTransport::TcpDataTransport(const EngineSettings &settings)
    : settings_(settings)
{
}

std::unique_ptr<IDataConnection> TcpDataTransport::open(const DataConnectionDescriptor &descriptor,
                                                        QString *errorString)
{
    auto fail = [errorString](const QString &message) -> std::unique_ptr<IDataConnection> {
        qDebug() << "DATA:" << message;
        if (errorString) {
            *errorString = message;
        }
        return nullptr;
    };

    if (!descriptor.hasPeerAddress()) {
        return fail(QStringLiteral("No data connection negotiated"));
    }
    if (descriptor.isSecure() && !canEncrypt()) {
        return fail(QStringLiteral("Protected data connection requested but TLS is not configured"));
    }

    std::unique_ptr<QTcpSocket> socket = createSocket(descriptor.isSecure());

    if (descriptor.mode() == DataConnectionDescriptor::Mode::Active) {
        socket->connectToHost(descriptor.address(), descriptor.port());
        if (!socket->waitForConnected(settings_.connectTimeoutMs)) {
            return fail(QString("Cannot connect to %1:%2: %3")
                            .arg(descriptor.address().toString())
                            .arg(descriptor.port())
                            .arg(socket->errorString()));
        }
    } else {
        const qintptr handle = descriptor.listener()->takeConnection(settings_.connectTimeoutMs);
        if (handle == -1) {
            return fail(QString("No client connected to passive port %1").arg(descriptor.port()));
        }
        if (!socket->setSocketDescriptor(handle)) {
            return fail(QString("Cannot adopt accepted connection: %1").arg(socket->errorString()));
        }
    }

    if (descriptor.isSecure() && !startEncryption(*socket, errorString)) {
        socket->abort();
        return nullptr;
    }

    LOG_VERBOSE() << "DATA: Connected" << socket->peerAddress().toString() << socket->peerPort();
    return std::make_unique<TcpDataConnection>(std::move(socket), settings_.idleTimeoutMs,
                                               settings_.bufferSize);
}

std::optional<DataConnectionDescriptor> TcpDataTransport::createPassiveDescriptor(bool secure)
{
    auto listener = std::make_shared<PassiveListener>();
    const QHostAddress bindAddress = settings_.passiveAddress.isNull()
                                         ? QHostAddress(QHostAddress::AnyIPv4)
                                         : settings_.passiveAddress;

    if (!listener->listenInRange(bindAddress, settings_.passivePortMin, settings_.passivePortMax)) {
        return std::nullopt;
    }

    qDebug() << "PASV: Listening on" << listener->serverAddress().toString() << listener->serverPort();
    return DataConnectionDescriptor::passive(std::move(listener), settings_.passiveAddress, secure);
}

void TcpDataTransport::setSslConfiguration(const QSslConfiguration &configuration)
{
    sslConfiguration_ = configuration;
}

bool TcpDataTransport::canEncrypt() const
{
    return sslConfiguration_
           && !sslConfiguration_->localCertificate().isNull()
           && !sslConfiguration_->privateKey().isNull()
           && QSslSocket::supportsSsl();
}

std::unique_ptr<QTcpSocket> TcpDataTransport::createSocket(bool secure) const
{
    if (secure) {
        auto socket = std::make_unique<QSslSocket>();
        socket->setSslConfiguration(*sslConfiguration_);
        return socket;
    }
    return std::make_unique<QTcpSocket>();
}

bool TcpDataTransport::startEncryption(QTcpSocket &socket, QString *errorString) const
{
    auto *sslSocket = qobject_cast<QSslSocket *>(&socket);
    if (!sslSocket) {
        return false;
    }

    // The server side of an FTP data connection is always the TLS server,
    // also when it connected out in active mode
    sslSocket->startServerEncryption();
    if (!sslSocket->waitForEncrypted(settings_.connectTimeoutMs)) {
        const QString message = QString("TLS handshake failed: %1").arg(sslSocket->errorString());
        qDebug() << "DATA:" << message;
        if (errorString) {
            *errorString = message;
        }
        return false;
    }
    return true;
}
