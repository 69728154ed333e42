/**
 * @file serverstatistics.h
 * @brief Thread-safe upload counters shared by all sessions.
 */

#ifndef SERVERSTATISTICS_H
#define SERVERSTATISTICS_H

#include <QDateTime>
#include <QHash>
#include <QMutex>
#include <QObject>
#include <QString>

#include "iftpstatistics.h"

/**
 * @brief Aggregates upload statistics across sessions.
 *
 * recordUpload() may be called from any session thread. The
 * uploadRecorded() signal is emitted from the calling thread, so receivers in
 * other threads get it queued.
 *
 * @par Example usage:
 * @code
 * ServerStatistics *stats = new ServerStatistics(this);
 * connect(stats, &ServerStatistics::uploadRecorded,
 *         this, &MyMonitor::onUpload);
 * StoreUniqueCommand stou(settings, stats);
 * @endcode
 */
class ServerStatistics : public QObject, public IFtpStatistics
{
    Q_OBJECT

public:
    explicit ServerStatistics(QObject *parent = nullptr);
    ~ServerStatistics() override = default;

    void recordUpload(const FtpSession &session, const FtpFile &file, qint64 bytes) override;

    /// @name Counters
    /// @{
    [[nodiscard]] qint64 totalUploadCount() const;
    [[nodiscard]] qint64 totalUploadBytes() const;
    [[nodiscard]] qint64 uploadCountFor(const QString &identity) const;
    [[nodiscard]] QDateTime lastUploadTime() const;
    /// @}

    /**
     * @brief Resets all counters.
     */
    void reset();

signals:
    /**
     * @brief Emitted after an upload was recorded.
     * @param identity User that uploaded.
     * @param path Virtual path of the stored file.
     * @param bytes Bytes received.
     */
    void uploadRecorded(const QString &identity, const QString &path, qint64 bytes);

private:
    mutable QMutex mutex_;
    qint64 totalUploadCount_ = 0;
    qint64 totalUploadBytes_ = 0;
    QHash<QString, qint64> uploadsByIdentity_;
    QDateTime lastUploadTime_;
};

#endif // SERVERSTATISTICS_H
