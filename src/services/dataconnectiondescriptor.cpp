#include "dataconnectiondescriptor.h"
#include "passivelistener.h"

#include <QRegularExpression>

DataConnectionDescriptor DataConnectionDescriptor::active(const QHostAddress &address, quint16 port,
                                                          bool secure)
{
    DataConnectionDescriptor descriptor;
    descriptor.mode_ = Mode::Active;
    descriptor.address_ = address;
    descriptor.port_ = port;
    descriptor.secure_ = secure;
    return descriptor;
}

DataConnectionDescriptor DataConnectionDescriptor::passive(std::shared_ptr<PassiveListener> listener,
                                                           const QHostAddress &advertisedAddress,
                                                           bool secure)
{
    DataConnectionDescriptor descriptor;
    descriptor.mode_ = Mode::Passive;
    if (listener) {
        descriptor.address_ = advertisedAddress.isNull() ? listener->serverAddress() : advertisedAddress;
        descriptor.port_ = listener->serverPort();
    }
    descriptor.secure_ = secure;
    descriptor.listener_ = std::move(listener);
    return descriptor;
}

std::optional<DataConnectionDescriptor> DataConnectionDescriptor::fromHostPort(const QString &text,
                                                                              bool secure)
{
    static const QRegularExpression rx(
        "^\\s*(\\d{1,3}),(\\d{1,3}),(\\d{1,3}),(\\d{1,3}),(\\d{1,3}),(\\d{1,3})\\s*$");
    const auto match = rx.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    int values[6];
    for (int i = 0; i < 6; ++i) {
        values[i] = match.captured(i + 1).toInt();
        if (values[i] > 255) {
            return std::nullopt;
        }
    }

    const int port = (values[4] * PortMultiplier) + values[5];
    if (port == 0) {
        return std::nullopt;
    }

    const QHostAddress address(QString("%1.%2.%3.%4")
                                   .arg(values[0])
                                   .arg(values[1])
                                   .arg(values[2])
                                   .arg(values[3]));
    return active(address, static_cast<quint16>(port), secure);
}

bool DataConnectionDescriptor::hasPeerAddress() const
{
    switch (mode_) {
    case Mode::Active:
        return !address_.isNull() && port_ != 0;
    case Mode::Passive:
        return listener_ && listener_->isListening();
    case Mode::None:
        break;
    }
    return false;
}

QString DataConnectionDescriptor::toHostPortString() const
{
    bool isIpv4 = false;
    const quint32 ipv4 = address_.toIPv4Address(&isIpv4);
    if (!isIpv4) {
        return QString();
    }

    return QString("%1,%2,%3,%4,%5,%6")
        .arg((ipv4 >> 24) & 0xFF)
        .arg((ipv4 >> 16) & 0xFF)
        .arg((ipv4 >> 8) & 0xFF)
        .arg(ipv4 & 0xFF)
        .arg(port_ / PortMultiplier)
        .arg(port_ % PortMultiplier);
}
