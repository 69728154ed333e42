/**
 * @file serverstatistics.cpp
 * @brief Implementation of the ServerStatistics service.
 */

#include "serverstatistics.h"
#include "ifilesystemview.h"
#include "models/ftpsession.h"

#include <QMutexLocker>

ServerStatistics::ServerStatistics(QObject *parent)
    : QObject(parent)
{
}

void ServerStatistics::recordUpload(const FtpSession &session, const FtpFile &file, qint64 bytes)
{
    const QString identity = session.identity();
    {
        QMutexLocker locker(&mutex_);
        ++totalUploadCount_;
        totalUploadBytes_ += bytes;
        ++uploadsByIdentity_[identity];
        lastUploadTime_ = QDateTime::currentDateTimeUtc();
    }

    emit uploadRecorded(identity, file.fullName(), bytes);
}

qint64 ServerStatistics::totalUploadCount() const
{
    QMutexLocker locker(&mutex_);
    return totalUploadCount_;
}

qint64 ServerStatistics::totalUploadBytes() const
{
    QMutexLocker locker(&mutex_);
    return totalUploadBytes_;
}

qint64 ServerStatistics::uploadCountFor(const QString &identity) const
{
    QMutexLocker locker(&mutex_);
    return uploadsByIdentity_.value(identity, 0);
}

QDateTime ServerStatistics::lastUploadTime() const
{
    QMutexLocker locker(&mutex_);
    return lastUploadTime_;
}

void ServerStatistics::reset()
{
    QMutexLocker locker(&mutex_);
    totalUploadCount_ = 0;
    totalUploadBytes_ = 0;
    uploadsByIdentity_.clear();
    lastUploadTime_ = QDateTime();
}
