#include "dataconnectionmanager.h"

#include <QDebug>

DataConnectionManager::DataConnectionManager(IDataTransport &transport)
    : transport_(transport)
{
}

DataConnectionManager::~DataConnectionManager()
{
    close();
}

void DataConnectionManager::setDescriptor(const DataConnectionDescriptor &descriptor)
{
    close();
    descriptor_ = descriptor;
}

bool DataConnectionManager::isNegotiated() const
{
    return descriptor_ && descriptor_->hasPeerAddress();
}

IDataConnection *DataConnectionManager::open(QString *errorString)
{
    if (!isNegotiated()) {
        if (errorString) {
            *errorString = QStringLiteral("PORT or PASV must be issued first");
        }
        return nullptr;
    }

    if (connection_) {
        qWarning() << "DATA: Refusing to reuse an open data connection";
        if (errorString) {
            *errorString = QStringLiteral("Data connection already in use");
        }
        return nullptr;
    }

    connection_ = transport_.open(*descriptor_, errorString);
    return connection_.get();
}

void DataConnectionManager::close()
{
    if (connection_) {
        if (!connection_->close()) {
            qWarning() << "DATA: Data connection released with errors";
        }
        connection_.reset();
    }
    descriptor_.reset();
}
